// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Model.hpp"
#include "Logging.hpp"
#include <llama.h>
#include <util/throw_ex.hpp>

namespace lmsvc::llama {
namespace {
llama_model_params llamaFromModelParams(const Model::Params& params, ModelLoadProgressCb& loadProgressCb) {
    static ggml_backend_dev_t devicesCpu[] = {
        ggml_backend_dev_by_type(GGML_BACKEND_DEVICE_TYPE_CPU),
        nullptr
    };

    static ggml_backend_dev_t devicesGpu[] = {
        ggml_backend_dev_by_type(GGML_BACKEND_DEVICE_TYPE_GPU),
        nullptr
    };

    llama_model_params llamaParams = llama_model_default_params();

    // without a gpu device llama.cpp picks what's available
    if (params.gpu && devicesGpu[0]) {
        llamaParams.devices = devicesGpu;
    }
    else {
        llamaParams.devices = devicesCpu;
    }

    llamaParams.n_gpu_layers = params.gpu ? 10000 : 0;
    llamaParams.vocab_only = params.vocabOnly;

    if (loadProgressCb) {
        llamaParams.progress_callback = +[](float progress, void* userData) {
            auto progressCallback = reinterpret_cast<ModelLoadProgressCb*>(userData);
            (*progressCallback)(progress);
            return true;
        };
        llamaParams.progress_callback_user_data = &loadProgressCb;
    }

    return llamaParams;
}

llama_model* loadModel(const std::string& gguf, const Model::Params& params, ModelLoadProgressCb& pcb) {
    LMSVC_LLAMA_LOG(Info, "Loading model from ", gguf, params.vocabOnly ? " (vocab only)" : "");
    auto lmodel = llama_model_load_from_file(gguf.c_str(), llamaFromModelParams(params, pcb));
    if (!lmodel) {
        throw_ex{} << "Failed to load model from " << gguf;
    }
    return lmodel;
}
} // namespace

Model::Model(const std::string& gguf, Params params, ModelLoadProgressCb pcb)
    : m_params(params)
    , m_lmodel(loadModel(gguf, params, pcb), llama_model_free)
{}

Model::~Model() = default;

uint32_t Model::trainCtxLength() const noexcept {
    return uint32_t(llama_model_n_ctx_train(m_lmodel.get()));
}

bool Model::shouldAddBosToken() const noexcept {
    return llama_vocab_get_add_bos(m_vocab.lvocab());
}

bool Model::hasEncoder() const noexcept {
    return llama_model_has_encoder(m_lmodel.get());
}

} // namespace lmsvc::llama
