// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Token.hpp"
#include <span>

struct llama_context;

namespace lmsvc::llama {
class Instance;

// a single generation on an instance's context
// the context is cleared when the session starts
class LMSVC_LLAMA_API Session {
public:
    Session(Instance& instance, llama_context* ctx);
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    ~Session();

    // decode the prompt, must be called once before getToken
    // throws if the prompt doesn't fit in the context
    void setInitialPrompt(std::span<const Token> prompt);

    // sample the next token
    // returns Token_Invalid on end of generation
    // throws if the context is full
    Token getToken();

    // number of tokens in the context
    uint32_t numPast() const noexcept { return m_state.numPast; }

private:
    void doDecode(std::span<const Token> tokens);
    void flushPendingState();

    struct State {
        enum class Phase {
            Initial,
            Generating
        };

        Phase m_phase = Phase::Initial;
        Token m_currToken = Token_Invalid;

        uint32_t maxTokens = 0;
        uint32_t numPast = 0; // number of tokens in the context (that's prompt + generated)
    };

    Instance& m_instance;
    llama_context* m_ctx;
    State m_state;
};

} // namespace lmsvc::llama
