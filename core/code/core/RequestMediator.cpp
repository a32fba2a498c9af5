// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "RequestMediator.hpp"
#include "PromptFormatter.hpp"
#include "Logging.hpp"

#include <util/strings.hpp>
#include <util/throw_ex.hpp>

#include <chrono>
#include <cmath>

namespace lmsvc::core {

namespace {
using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

ModelError invalidRequest(std::string_view message, std::string details) {
    return {std::string(message), std::move(details)};
}
} // namespace

std::string_view RequestMediator::stageName(Stage stage) noexcept {
    switch (stage) {
    case Stage::Idle: return "idle";
    case Stage::Formatting: return "formatting";
    case Stage::Generating: return "generating";
    case Stage::Extracting: return "extracting";
    case Stage::Scoring: return "scoring";
    case Stage::Done: return "done";
    }
    return "unknown";
}

RequestMediator::RequestMediator(std::unique_ptr<GenerationBackend> backend, TokenizerAdapter tokenizer, MediatorConfig config)
    : m_backend(std::move(backend))
    , m_tokenizer(std::move(tokenizer))
    , m_config(std::move(config))
    , m_scorer(m_config.scoring)
{
    if (!m_backend) {
        throw_ex{} << "RequestMediator requires a generation backend";
    }
}

RequestMediator::~RequestMediator() = default;

std::optional<std::string> RequestMediator::validate(const GenerationRequest& request) const {
    if (request.prompt.empty()) {
        return "prompt must not be empty";
    }
    if (request.maxLength <= 0) {
        return "max_length must be positive, got " + std::to_string(request.maxLength);
    }
    if (request.maxLength > m_config.maxLengthLimit) {
        return "max_length must not exceed " + std::to_string(m_config.maxLengthLimit)
            + ", got " + std::to_string(request.maxLength);
    }
    if (!std::isfinite(request.temperature) || request.temperature < 0) {
        return "temperature must be a non-negative number, got " + std::to_string(request.temperature);
    }
    if (request.topK < 0) {
        return "top_k must not be negative, got " + std::to_string(request.topK);
    }
    if (!(request.topP > 0 && request.topP <= 1)) {
        return "top_p must be in (0, 1], got " + std::to_string(request.topP);
    }
    return std::nullopt;
}

std::optional<std::string> RequestMediator::validate(const ClassificationRequest& request) const {
    if (request.text.empty()) {
        return "text must not be empty";
    }
    if (request.labels.empty()) {
        return "labels must not be empty";
    }
    for (size_t i = 0; i < request.labels.size(); ++i) {
        if (util::trim(request.labels[i]).empty()) {
            return "label " + std::to_string(i) + " is empty";
        }
    }
    return std::nullopt;
}

SamplingConfig RequestMediator::generationSampling(const GenerationRequest& request) const {
    return {
        .maxLength = uint32_t(request.maxLength),
        .temperature = float(request.temperature),
        .topK = request.topK,
        .topP = float(request.topP),
        .repetitionPenalty = m_config.repetitionPenalty,
        .doSample = true,
        .seed = m_config.seed,
    };
}

SamplingConfig RequestMediator::classificationSampling(uint32_t promptTokens) const {
    return {
        .maxLength = promptTokens + m_config.classificationMargin,
        .maxNewTokens = m_config.classificationMargin,
        .temperature = m_config.classificationTemperature,
        .topK = 0,
        .topP = 1.f,
        .repetitionPenalty = m_config.repetitionPenalty,
        .doSample = false,
        .seed = m_config.seed,
    };
}

Result<GenerationResponse> RequestMediator::generateText(const GenerationRequest& request) {
    LMSVC_CORE_LOG(Info, "Received generation request with prompt: ", util::preview(request.prompt, m_config.previewLength));

    if (auto error = validate(request)) {
        LMSVC_CORE_LOG(Warning, "Rejected generation request: ", *error);
        return itlib::unexpected(invalidRequest("Invalid generation request", std::move(*error)));
    }

    auto stage = Stage::Idle;
    try {
        const auto start = Clock::now();

        stage = Stage::Formatting;
        const auto prompt = PromptFormatter::formatGeneration(request.prompt);

        std::lock_guard lock(m_backendMutex);

        stage = Stage::Generating;
        const auto raw = m_backend->sample(prompt, generationSampling(request));

        stage = Stage::Extracting;
        GenerationResponse response;
        response.generatedText = m_extractor.extract(raw);
        response.inputTokens = m_tokenizer.countTokens(request.prompt);
        response.generatedTokens = m_tokenizer.countTokens(response.generatedText);
        response.generationTime = secondsSince(start);

        stage = Stage::Done;
        LMSVC_CORE_LOG(Info, "Generated text of length ", response.generatedText.size(),
            " (", response.generatedTokens, " tokens) in ", response.generationTime, " seconds");
        return response;
    }
    catch (const std::exception& e) {
        LMSVC_CORE_LOG(Error, "Error in text generation while ", stageName(stage), ": ", e.what());
        return itlib::unexpected(ModelError{"Failed to generate text", e.what()});
    }
}

Result<ClassificationResponse> RequestMediator::classifyText(const ClassificationRequest& request) {
    LMSVC_CORE_LOG(Info, "Received classification request for text: ", util::preview(request.text, m_config.previewLength));

    if (auto error = validate(request)) {
        LMSVC_CORE_LOG(Warning, "Rejected classification request: ", *error);
        return itlib::unexpected(invalidRequest("Invalid classification request", std::move(*error)));
    }

    auto stage = Stage::Idle;
    try {
        const auto start = Clock::now();

        stage = Stage::Formatting;
        const auto prompt = PromptFormatter::formatClassification(request.text, request.labels);

        std::lock_guard lock(m_backendMutex);

        stage = Stage::Generating;
        const auto promptTokens = m_tokenizer.countTokens(prompt);
        const auto raw = m_backend->sample(prompt, classificationSampling(uint32_t(promptTokens)));

        stage = Stage::Extracting;
        const auto reply = m_extractor.extract(raw);

        stage = Stage::Scoring;
        auto score = m_scorer.score(reply, request.labels);
        if (score.tier == MatchTier::Fallback) {
            if (!m_extractor.hasDelimiter(raw)) {
                LMSVC_CORE_LOG(Warning, "Backend output did not echo the prompt template, scoring the whole output");
            }
            LMSVC_CORE_LOG(Warning, "No label matched reply '", util::preview(reply, m_config.previewLength),
                "', falling back to '", score.label, "'");
        }

        ClassificationResponse response;
        response.label = std::move(score.label);
        response.confidence = score.confidence;
        response.classificationTime = secondsSince(start);

        stage = Stage::Done;
        LMSVC_CORE_LOG(Info, "Classified text as '", response.label, "' with confidence ", response.confidence,
            " (", tierName(score.tier), " match) in ", response.classificationTime, " seconds");
        return response;
    }
    catch (const std::exception& e) {
        LMSVC_CORE_LOG(Error, "Error in text classification while ", stageName(stage), ": ", e.what());
        return itlib::unexpected(ModelError{"Failed to classify text", e.what()});
    }
}

} // namespace lmsvc::core
