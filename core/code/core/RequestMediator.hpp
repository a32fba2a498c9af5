// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "Types.hpp"
#include "GenerationBackend.hpp"
#include "TokenizerAdapter.hpp"
#include "ResponseExtractor.hpp"
#include "ClassificationScorer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lmsvc::core {

struct MediatorConfig {
    ScoringConfig scoring;

    float repetitionPenalty = 1.1f;

    // classification decodes greedily at a low temperature
    // and may produce at most this many tokens past the formatted prompt
    float classificationTemperature = 0.1f;
    uint32_t classificationMargin = 50;

    int32_t maxLengthLimit = 4096; // requests with a larger max_length are rejected

    std::optional<uint32_t> seed; // empty = random

    size_t previewLength = 50; // request text shown in logs
};

// turns typed requests into backend calls and typed responses
//
// a request goes through Idle -> Formatting -> Generating -> Extracting -> (Scoring) -> Done
// any failure ends it with a ModelError instead. Nothing is mutated before Done, so a failed request
// leaves no trace.
//
// the backend is owned exclusively and every call into it is serialized
class RequestMediator {
public:
    enum class Stage {
        Idle,
        Formatting,
        Generating,
        Extracting,
        Scoring,
        Done,
    };
    static std::string_view stageName(Stage stage) noexcept;

    // throws if the backend is null or the scoring config is invalid
    RequestMediator(std::unique_ptr<GenerationBackend> backend, TokenizerAdapter tokenizer, MediatorConfig config = {});
    ~RequestMediator();

    RequestMediator(const RequestMediator&) = delete;
    RequestMediator& operator=(const RequestMediator&) = delete;

    Result<GenerationResponse> generateText(const GenerationRequest& request);
    Result<ClassificationResponse> classifyText(const ClassificationRequest& request);

    const MediatorConfig& config() const noexcept { return m_config; }

    // descriptions of why a request is invalid or empty if valid
    std::optional<std::string> validate(const GenerationRequest& request) const;
    std::optional<std::string> validate(const ClassificationRequest& request) const;

private:
    SamplingConfig generationSampling(const GenerationRequest& request) const;
    SamplingConfig classificationSampling(uint32_t promptTokens) const;

    std::unique_ptr<GenerationBackend> m_backend;
    TokenizerAdapter m_tokenizer;
    MediatorConfig m_config;
    ResponseExtractor m_extractor;
    ClassificationScorer m_scorer;

    std::mutex m_backendMutex;
};

} // namespace lmsvc::core
