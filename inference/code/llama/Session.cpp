// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Session.hpp"
#include "Model.hpp"
#include "Instance.hpp"
#include "Logging.hpp"

#include <llama.h>

#include <util/throw_ex.hpp>

namespace lmsvc::llama {
namespace {
llama_batch makeInputBatch(std::span<const Token> tokens) {
    // llama.cpp does not touch the tokens of input batches, but llama_batch takes them as non-const
    auto nonConstTokens = const_cast<Token*>(tokens.data());
    return llama_batch_get_one(nonConstTokens, int32_t(tokens.size()));
}
} // namespace

Session::Session(Instance& instance, llama_context* ctx)
    : m_instance(instance)
    , m_ctx(ctx)
{
    llama_kv_self_clear(m_ctx);
    llama_synchronize(m_ctx);
    llama_perf_context_reset(m_ctx);
    m_instance.sampler().reset();

    const auto ctxLen = llama_n_ctx(m_ctx);
    m_state.maxTokens = ctxLen - 4;
}

Session::~Session() = default;

void Session::setInitialPrompt(std::span<const Token> initialPrompt) {
    if (m_state.m_phase != State::Phase::Initial) {
        throw_ex{} << "Session already started";
    }

    Token initialToken;
    if (initialPrompt.empty()) {
        initialToken = llama_vocab_bos(m_instance.model().vocab().lvocab());
        initialPrompt = {&initialToken, 1};
    }

    if (initialPrompt.size() > m_state.maxTokens) {
        throw_ex{} << "Prompt too long. Got " << initialPrompt.size() << " tokens, max: " << m_state.maxTokens;
    }

    // the prompt counts towards the repetition penalty as in the usual transformers pipeline
    auto& sampler = m_instance.sampler();
    for (auto t : initialPrompt) {
        sampler.accept(t);
    }

    doDecode(initialPrompt);
    m_state.m_phase = State::Phase::Generating;
}

Token Session::getToken() {
    if (m_state.m_phase != State::Phase::Generating) {
        throw_ex{} << "Session hasn't started yet";
    }

    flushPendingState();

    auto& sampler = m_instance.sampler();
    auto& vocab = m_instance.model().vocab();

    m_state.m_currToken = sampler.sample(m_ctx);

    if (vocab.isEog(m_state.m_currToken)) {
        m_state.m_currToken = Token_Invalid;
        return Token_Invalid;
    }

    sampler.accept(m_state.m_currToken);
    return m_state.m_currToken;
}

void Session::doDecode(std::span<const Token> tokens) {
    const auto ctxLen = llama_n_ctx(m_ctx);
    if (m_state.numPast + tokens.size() >= ctxLen) {
        throw_ex{} << "context limit of " << ctxLen << " reached";
    }

    const auto batchSize = llama_n_batch(m_ctx);

    // decode with batches of batchSize
    while (!tokens.empty()) {
        auto batchTokens = tokens.size() > batchSize ? tokens.first(batchSize) : tokens;
        tokens = tokens.subspan(batchTokens.size());
        auto batch = makeInputBatch(batchTokens);
        if (llama_decode(m_ctx, batch) != 0) {
            throw_ex{} << "Failed to decode tokens";
        }
        m_state.numPast += uint32_t(batchTokens.size());
    }
}

void Session::flushPendingState() {
    if (m_state.m_currToken != Token_Invalid) {
        // the last sampled token is decoded lazily, so a finished session never decodes it
        const auto token = m_state.m_currToken;
        m_state.m_currToken = Token_Invalid;
        doDecode({&token, 1});
    }
}

} // namespace lmsvc::llama
