// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <core/GenerationBackend.hpp>
#include <core/TokenizerAdapter.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace lmsvc::test {

// records calls and replies with a canned continuation
struct FakeBackendState {
    std::string reply; // appended after the echoed prompt
    bool echoPrompt = true;
    std::string failure; // if not empty, sample throws with this text

    struct Call {
        std::string prompt;
        core::SamplingConfig config;
    };
    std::vector<Call> calls;
};

class FakeBackend final : public core::GenerationBackend {
public:
    explicit FakeBackend(std::shared_ptr<FakeBackendState> state)
        : m_state(std::move(state))
    {}

    std::string sample(std::string_view prompt, const core::SamplingConfig& config) override {
        m_state->calls.push_back({std::string(prompt), config});
        if (!m_state->failure.empty()) {
            throw std::runtime_error(m_state->failure);
        }
        std::string ret;
        if (m_state->echoPrompt) {
            ret = prompt;
        }
        ret += m_state->reply;
        return ret;
    }
private:
    std::shared_ptr<FakeBackendState> m_state;
};

// one token per whitespace separated word
inline core::TokenizerAdapter makeWordTokenizer() {
    return core::TokenizerAdapter([](std::string_view text) {
        std::vector<int32_t> tokens;
        bool inWord = false;
        for (char c : text) {
            const bool space = c == ' ' || c == '\n' || c == '\t' || c == '\r';
            if (!space && !inWord) {
                tokens.push_back(int32_t(tokens.size()));
            }
            inWord = !space;
        }
        return tokens;
    });
}

} // namespace lmsvc::test
