// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <itlib/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lmsvc::core {

struct GenerationRequest {
    std::string prompt;
    int32_t maxLength = 256; // upper bound on the total sequence length, prompt included
    double temperature = 0.7;
    int32_t topK = 50; // 0 = disabled
    double topP = 0.95; // (0, 1], 1 = disabled
};

struct GenerationResponse {
    std::string generatedText;
    double generationTime = 0; // seconds
    int32_t inputTokens = 0;
    int32_t generatedTokens = 0;
};

struct ClassificationRequest {
    std::string text;
    std::vector<std::string> labels;
};

struct ClassificationResponse {
    std::string label; // always one of the request labels
    double confidence = 0;
    double classificationTime = 0; // seconds
};

// the single error type reported to callers
struct ModelError {
    std::string message; // short summary
    std::string details; // underlying cause
};

template <typename T>
using Result = itlib::expected<T, ModelError>;

// the part of a request which controls decoding
struct SamplingConfig {
    uint32_t maxLength = 0; // total tokens, prompt included
    // when set, overrides maxLength: tokens to generate after the prompt as the backend itself tokenizes it
    std::optional<uint32_t> maxNewTokens;
    float temperature = 0.8f;
    int32_t topK = 0;
    float topP = 1.f;
    float repetitionPenalty = 1.f;
    bool doSample = true; // false = greedy
    std::optional<uint32_t> seed; // empty = random
};

} // namespace lmsvc::core
