// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Backend.hpp"
#include "Model.hpp"
#include "Logging.hpp"

#include <llama.h>

#include <util/throw_ex.hpp>

namespace lmsvc::llama {

namespace {
// stops the session on scope exit, also when decoding throws
class SessionGuard {
public:
    explicit SessionGuard(Instance& instance)
        : m_instance(instance)
        , m_session(instance.startSession())
    {}
    ~SessionGuard() {
        m_instance.stopSession();
    }
    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    Session& session() noexcept { return m_session; }
private:
    Instance& m_instance;
    Session& m_session;
};
} // namespace

Backend::Backend(std::shared_ptr<Model> model, Instance::InitParams params)
    : m_model([&] {
        if (!model) {
            throw_ex{} << "Backend requires a model";
        }
        return std::move(model);
    }())
    , m_instance(*m_model, params)
{}

Backend::~Backend() = default;

void Backend::warmup() {
    m_instance.warmup();
}

Sampler::Params Backend::samplerParamsFrom(const core::SamplingConfig& config) {
    return {
        .rngSeed = config.seed.value_or(LLAMA_DEFAULT_SEED),
        .minKeep = 1,
        .topK = config.topK,
        .topP = config.topP,
        .temp = config.temperature,
        .repetitionPenalty = {
            .numTokens = 64,
            .repeat = config.repetitionPenalty,
        },
        .greedy = !config.doSample,
    };
}

int64_t Backend::tokenBudget(const core::SamplingConfig& config, int64_t promptTokens) noexcept {
    if (config.maxNewTokens) {
        return *config.maxNewTokens;
    }
    return int64_t(config.maxLength) - promptTokens;
}

std::string Backend::sample(std::string_view prompt, const core::SamplingConfig& config) {
    auto& vocab = m_model->vocab();

    const auto tokens = vocab.tokenize(prompt, true, true);

    std::string ret(prompt);

    int64_t budget = tokenBudget(config, int64_t(tokens.size()));
    if (budget <= 0) {
        LMSVC_LLAMA_LOG(Warning, "Prompt of ", tokens.size(), " tokens leaves no room for generation within max length ",
            config.maxLength);
        return ret;
    }

    // one slot is needed for the pending token, see Session
    const int64_t room = int64_t(m_instance.ctxLength()) - 5 - int64_t(tokens.size());
    if (budget > room && room > 0) {
        LMSVC_LLAMA_LOG(Warning, "Max length ", config.maxLength, " exceeds the context, generating at most ", room, " tokens");
        budget = room;
    }

    m_instance.resetSampler(samplerParamsFrom(config));

    SessionGuard guard(m_instance);
    auto& session = guard.session();
    session.setInitialPrompt(tokens);

    int64_t generated = 0;
    for (; generated < budget; ++generated) {
        auto token = session.getToken();
        if (token == Token_Invalid) {
            break;
        }
        ret += vocab.tokenToString(token, false);
    }

    LMSVC_LLAMA_LOG(Debug, "Sampled ", generated, " tokens after a prompt of ", tokens.size());
    return ret;
}

core::TokenizerAdapter makeTokenizerAdapter(std::shared_ptr<const Model> model) {
    if (!model) {
        throw_ex{} << "Tokenizer adapter requires a model";
    }
    return core::TokenizerAdapter([model = std::move(model)](std::string_view text) {
        return model->vocab().tokenize(text, true, false);
    });
}

} // namespace lmsvc::llama
