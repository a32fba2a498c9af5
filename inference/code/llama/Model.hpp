// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Vocab.hpp"

#include <util/mem_ext.hpp>
#include <itlib/ufunction.hpp>

#include <string>

struct llama_model;

namespace lmsvc::llama {

using ModelLoadProgressCb = itlib::ufunction<void(float)>;

class LMSVC_LLAMA_API Model {
public:
    struct Params {
        bool gpu = true; // try to load data on gpu
        bool vocabOnly = false; // do not load weights, only the vocab

        bool operator==(const Params& other) const noexcept = default;
    };

    // throws if the file can't be loaded
    Model(const std::string& gguf, Params params, ModelLoadProgressCb pcb = {});
    ~Model();

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    const Params& params() const noexcept { return m_params; }

    uint32_t trainCtxLength() const noexcept;
    bool shouldAddBosToken() const noexcept;
    bool hasEncoder() const noexcept;

    llama_model* lmodel() noexcept { return m_lmodel.get(); }
    const llama_model* lmodel() const noexcept { return m_lmodel.get(); }

    const Vocab& vocab() const noexcept { return m_vocab; }
private:
    const Params m_params;
    util::c_unique_ptr<llama_model> m_lmodel;

    Vocab m_vocab{*this};
};

} // namespace lmsvc::llama
