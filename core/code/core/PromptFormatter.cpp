// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "PromptFormatter.hpp"

namespace lmsvc::core {

std::string PromptFormatter::chatTurn(std::string_view userContent) {
    std::string ret;
    ret.reserve(SystemTag.size() + SystemPreamble.size() + UserTag.size() + userContent.size() + AssistantTag.size() + 3);
    ret += SystemTag;
    ret += '\n';
    ret += SystemPreamble;
    ret += '\n';
    ret += UserTag;
    ret += '\n';
    ret += userContent;
    ret += AssistantTag;
    return ret;
}

std::string PromptFormatter::formatGeneration(std::string_view prompt) {
    return chatTurn(prompt);
}

std::string PromptFormatter::formatClassification(std::string_view text, std::span<const std::string> labels) {
    std::string instruction = "Classify the following text into one of these categories: ";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i != 0) {
            instruction += ", ";
        }
        instruction += labels[i];
    }
    instruction += "\nRespond with exactly one category from the list and nothing else.";
    instruction += "\n\nText: ";
    instruction += text;
    instruction += "\n\nCategory:";
    return chatTurn(instruction);
}

} // namespace lmsvc::core
