// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Sampler.hpp"
#include "Session.hpp"
#include <util/mem_ext.hpp>
#include <memory>
#include <optional>

struct llama_context;

namespace lmsvc::llama {
class Model;

// a llama context over a model with its sampler
class LMSVC_LLAMA_API Instance {
public:
    struct InitParams {
        uint32_t ctxSize = 0; // context size for the model (0 = maximum allowed by model)
        uint32_t batchSize = 2048; // logical batch size for prompt processing (may be silently truncated to ctxSize)
        uint32_t ubatchSize = 512; // physical batch size for prompt processing (0 = batchSize)
        bool flashAttn = false; // enable flash attention
    };

    // throws if the context can't be created or the model is encoder-decoder
    explicit Instance(Model& model, InitParams params);
    ~Instance();

    // do an empty model run to load model data in cache
    void warmup();

    // only one session per instance can be active at a time
    Session& startSession();
    void stopSession() noexcept;

    const Model& model() const noexcept { return m_model; }

    uint32_t ctxLength() const noexcept;

    Sampler& sampler() noexcept { return *m_sampler; }

    // change sampler settings by replacing it
    // warning: this will clear any previous sampler state
    void resetSampler(const Sampler::Params& params) {
        m_sampler.reset(new Sampler(m_model, params));
    }

private:
    Model& m_model;
    std::unique_ptr<Sampler> m_sampler;
    util::c_unique_ptr<llama_context> m_lctx;
    std::optional<Session> m_session;
};

} // namespace lmsvc::llama
