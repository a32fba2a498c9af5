// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Sampler.hpp"
#include "Model.hpp"
#include <llama.h>
#include <util/throw_ex.hpp>
#include <cstddef>

namespace lmsvc::llama {

Sampler::Sampler(Model& model, const Params& params)
    : m_params(params)
    , m_samplerChain(llama_sampler_chain_init({ .no_perf = true }), llama_sampler_free)
{
    if (!m_samplerChain) {
        throw_ex{} << "Failed to create sampler chain";
    }

    auto chain = m_samplerChain.get();
    const auto& penalty = params.repetitionPenalty;

    if (penalty.repeat != 1.f && penalty.numTokens != 0) {
        const int32_t lastN = penalty.numTokens < 0 ? int32_t(model.trainCtxLength()) : penalty.numTokens;
        llama_sampler_chain_add(chain, llama_sampler_init_penalties(lastN, penalty.repeat, 0.f, 0.f));
    }

    if (params.greedy) {
        llama_sampler_chain_add(chain, llama_sampler_init_greedy());
        return;
    }

    const size_t minKeep = params.minKeep;
    if (params.topK > 0) {
        llama_sampler_chain_add(chain, llama_sampler_init_top_k(params.topK));
    }
    if (params.topP < 1.f) {
        llama_sampler_chain_add(chain, llama_sampler_init_top_p(params.topP, minKeep));
    }
    llama_sampler_chain_add(chain, llama_sampler_init_temp(params.temp));
    llama_sampler_chain_add(chain, llama_sampler_init_dist(params.rngSeed));
}

Sampler::~Sampler() = default;

void Sampler::accept(Token id) {
    llama_sampler_accept(m_samplerChain.get(), id);
}

namespace {
llama_token_data_array fillLogits(std::vector<llama_token_data>& out, llama_context* lctx, int idx) {
    const auto* logits = llama_get_logits_ith(lctx, idx);
    if (!logits) {
        throw_ex{} << "No logits for token " << idx;
    }

    const auto* lmodel = llama_get_model(lctx);
    const int vocabSize = llama_vocab_n_tokens(llama_model_get_vocab(lmodel));

    out.resize(vocabSize);

    for (llama_token id = 0; id < vocabSize; id++) {
        out[id] = {id, logits[id], 0.0f};
    }

    return {out.data(), out.size(), -1, false};
}
} // namespace

Token Sampler::sample(llama_context* lctx, int idx) {
    auto cur = fillLogits(m_cur, lctx, idx);

    llama_sampler_apply(m_samplerChain.get(), &cur);

    if (cur.selected == -1) {
        throw_ex{} << "No selected token during sampling - check the sampling configuration";
    }

    return cur.data[cur.selected].id;
}

void Sampler::reset() {
    llama_sampler_reset(m_samplerChain.get());
}

} // namespace lmsvc::llama
