// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "PromptFormatter.hpp"

#include <string>
#include <string_view>

namespace lmsvc::core {

// isolates the model reply from backend output which echoes the prompt
class ResponseExtractor {
public:
    explicit ResponseExtractor(std::string delimiter = std::string(PromptFormatter::AssistantTag));

    // text after the last delimiter, trimmed of whitespace and matching quotes
    // if the delimiter is missing, the whole output trimmed the same way
    // never throws on malformed output
    std::string extract(std::string_view rawOutput) const;

    bool hasDelimiter(std::string_view rawOutput) const noexcept;

    const std::string& delimiter() const noexcept { return m_delimiter; }
private:
    std::string m_delimiter;
};

} // namespace lmsvc::core
