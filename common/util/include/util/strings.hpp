// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// small ascii string helpers
// case folding is ascii only: non-ascii bytes are compared verbatim

namespace lmsvc::util {

inline constexpr std::string_view Whitespace = " \t\r\n\f\v";

inline std::string_view trim(std::string_view str) {
    const auto start = str.find_first_not_of(Whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = str.find_last_not_of(Whitespace);
    return str.substr(start, end - start + 1);
}

inline bool isQuote(char c) noexcept {
    return c == '"' || c == '\'' || c == '`';
}

// trim whitespace, then strip pairs of matching quotes around the text
// '"positive"' -> positive, ' `x` ' -> x, but '"x' -> "x
inline std::string_view trimQuoted(std::string_view str) {
    str = trim(str);
    while (str.size() >= 2 && isQuote(str.front()) && str.front() == str.back()) {
        str = trim(str.substr(1, str.size() - 2));
    }
    return str;
}

inline char toLower(char c) noexcept {
    return char(std::tolower(static_cast<unsigned char>(c)));
}

inline std::string toLower(std::string_view str) {
    std::string ret(str);
    std::transform(ret.begin(), ret.end(), ret.begin(), [](char c) { return toLower(c); });
    return ret;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return toLower(x) == toLower(y); });
}

// an empty needle is contained in everything
inline bool icontains(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char x, char y) { return toLower(x) == toLower(y); });
    return it != haystack.end() || needle.empty();
}

// text cut to at most maxLen bytes with "..." appended if anything was cut
// the cut never splits a utf-8 sequence
inline std::string preview(std::string_view text, size_t maxLen) {
    if (text.size() <= maxLen) {
        return std::string(text);
    }
    size_t cut = maxLen;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string ret(text.substr(0, cut));
    ret += "...";
    return ret;
}

// decimal tcp port, the whole string must be a number in [0, 65535]
inline std::optional<uint16_t> parsePort(std::string_view str) {
    unsigned long value = 0;
    auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value, 10);
    if (ec != std::errc{} || str.empty() || end != str.data() + str.size()) {
        return std::nullopt;
    }
    if (value > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    return uint16_t(value);
}

} // namespace lmsvc::util
