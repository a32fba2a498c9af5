// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Instance.hpp"
#include "Model.hpp"
#include "Logging.hpp"
#include "Session.hpp"

#include <llama.h>

#include <util/throw_ex.hpp>

#include <vector>

namespace lmsvc::llama {

namespace {
llama_context_params llamaFromInstanceInitParams(const Instance::InitParams& params) {
    llama_context_params llamaParams = llama_context_default_params();
    llamaParams.n_ctx = params.ctxSize;
    llamaParams.n_batch = params.batchSize;
    llamaParams.n_ubatch = params.ubatchSize;
    llamaParams.flash_attn = params.flashAttn;
    return llamaParams;
}

llama_context* createContext(Model& model, const Instance::InitParams& params) {
    if (model.params().vocabOnly) {
        throw_ex{} << "Cannot create an instance of a vocab-only model";
    }
    if (model.hasEncoder()) {
        throw_ex{} << "Encoder-decoder models are not supported";
    }
    auto lctx = llama_init_from_model(model.lmodel(), llamaFromInstanceInitParams(params));
    if (!lctx) {
        throw_ex{} << "Failed to create llama context";
    }
    return lctx;
}
} // namespace

Instance::Instance(Model& model, InitParams params)
    : m_model(model)
    , m_sampler(new Sampler(model, {}))
    , m_lctx(createContext(model, params), llama_free)
{
    const auto ctxLen = llama_n_ctx(m_lctx.get());
    const auto ctxTrain = model.trainCtxLength();
    if (ctxLen > ctxTrain) {
        LMSVC_LLAMA_LOG(Warning, "Instance requested context length ", ctxLen, " is greater than the model's training context length ", ctxTrain);
    }
}

Instance::~Instance() = default;

uint32_t Instance::ctxLength() const noexcept {
    return llama_n_ctx(m_lctx.get());
}

void Instance::warmup() {
    LMSVC_LLAMA_LOG(Info, "Running warmup");

    auto lctx = m_lctx.get();

    std::vector<llama_token> tmp;
    llama_token bos = llama_vocab_bos(m_model.vocab().lvocab());
    llama_token eos = llama_vocab_eos(m_model.vocab().lvocab());
    if (bos != LLAMA_TOKEN_NULL) {
        tmp.push_back(bos);
    }
    if (eos != LLAMA_TOKEN_NULL) {
        tmp.push_back(eos);
    }
    if (tmp.empty()) {
        tmp.push_back(0);
    }

    if (llama_decode(lctx, llama_batch_get_one(tmp.data(), int32_t(tmp.size()))) != 0) {
        throw_ex{} << "Warmup decode failed";
    }
    llama_kv_self_clear(lctx);
    llama_synchronize(lctx);
    llama_perf_context_reset(lctx);
}

Session& Instance::startSession() {
    if (m_session.has_value()) {
        throw_ex{} << "Session is already started. Stop it to start a new one.";
    }

    m_session.emplace(*this, m_lctx.get());
    return *m_session;
}

void Instance::stopSession() noexcept {
    m_session.reset();
}

} // namespace lmsvc::llama
