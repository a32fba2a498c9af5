// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Instance.hpp"
#include "Sampler.hpp"

#include <core/GenerationBackend.hpp>
#include <core/TokenizerAdapter.hpp>

#include <memory>

namespace lmsvc::llama {
class Model;

// generation backend running on a single llama instance
// not thread safe, calls must be serialized by the owner
class LMSVC_LLAMA_API Backend final : public core::GenerationBackend {
public:
    Backend(std::shared_ptr<Model> model, Instance::InitParams params);
    ~Backend();

    void warmup();

    // returns the prompt followed by the generated text
    std::string sample(std::string_view prompt, const core::SamplingConfig& config) override;

    static Sampler::Params samplerParamsFrom(const core::SamplingConfig& config);

    // new tokens allowed after a prompt of promptTokens, before capping to the context
    static int64_t tokenBudget(const core::SamplingConfig& config, int64_t promptTokens) noexcept;

    const Model& model() const noexcept { return *m_model; }

private:
    std::shared_ptr<Model> m_model;
    Instance m_instance;
};

// counts tokens like the model's tokenizer would encode plain text (bos included when the model adds one)
LMSVC_LLAMA_API core::TokenizerAdapter makeTokenizerAdapter(std::shared_ptr<const Model> model);

} // namespace lmsvc::llama
