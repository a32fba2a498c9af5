// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Token.hpp"
#include <util/mem_ext.hpp>
#include <vector>

struct llama_token_data;
struct llama_context;
struct llama_sampler;

namespace lmsvc::llama {

class Model;

// a llama.cpp sampler chain:
// penalties -> greedy
// penalties -> top-k -> top-p -> temperature -> dist
class LMSVC_LLAMA_API Sampler {
public:
    struct Params {
        uint32_t rngSeed = 0; // seed for the random number generator

        int32_t minKeep = 0; // 0 = disabled, otherwise samplers should return at least min_keep tokens

        int32_t topK = 40;  // <= 0 to disable
        float topP = 0.95f; // 1.0 = disabled
        float temp = 0.80f; // <= 0.0 picks the most likely token

        struct RepetitionPenalty {
            int32_t numTokens = 64; // last n tokens to penalize (0 = disable penalty, -1 = context size)
            float repeat = 1.00f;   // 1.0 = disabled
        } repetitionPenalty;

        bool greedy = false; // ignore topK, topP, temp and always take the most likely token
    };

    explicit Sampler(Model& model, const Params& params);
    ~Sampler();

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    const Params& params() const noexcept { return m_params; }

    // reset the sampler state (penalty history, rng)
    void reset();

    // sample from the logits of the idx-th token of the last batch (-1 = last)
    Token sample(llama_context* lctx, int idx = -1);

    // add token to the penalty history
    void accept(Token id);

private:
    Params m_params;
    util::c_unique_ptr<llama_sampler> m_samplerChain;

    // current tokens for sampling (one for each vocabulary entry)
    // kept as member so as to avoid reallocation on every sample call
    std::vector<llama_token_data> m_cur;
};

} // namespace lmsvc::llama
