// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <span>
#include <string>
#include <string_view>

namespace lmsvc::core {

// renders requests into the chat template the backend expects:
//
//   <|system|>
//   You are a helpful AI assistant.
//   <|user|>
//   {content}<|assistant|>
//
// inputs are interpolated verbatim: they may contain the tags themselves
class PromptFormatter {
public:
    static constexpr std::string_view SystemTag = "<|system|>";
    static constexpr std::string_view UserTag = "<|user|>";
    static constexpr std::string_view AssistantTag = "<|assistant|>";
    static constexpr std::string_view SystemPreamble = "You are a helpful AI assistant.";

    static std::string formatGeneration(std::string_view prompt);

    // instruction listing the labels and asking for exactly one of them
    static std::string formatClassification(std::string_view text, std::span<const std::string> labels);

private:
    static std::string chatTurn(std::string_view userContent);
};

} // namespace lmsvc::core
