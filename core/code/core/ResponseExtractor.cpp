// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "ResponseExtractor.hpp"

#include <util/strings.hpp>

namespace lmsvc::core {

ResponseExtractor::ResponseExtractor(std::string delimiter)
    : m_delimiter(std::move(delimiter))
{}

bool ResponseExtractor::hasDelimiter(std::string_view rawOutput) const noexcept {
    return !m_delimiter.empty() && rawOutput.find(m_delimiter) != std::string_view::npos;
}

std::string ResponseExtractor::extract(std::string_view rawOutput) const {
    std::string_view reply = rawOutput;
    if (!m_delimiter.empty()) {
        if (auto pos = rawOutput.rfind(m_delimiter); pos != std::string_view::npos) {
            reply = rawOutput.substr(pos + m_delimiter.size());
        }
    }
    return std::string(util::trimQuoted(reply));
}

} // namespace lmsvc::core
