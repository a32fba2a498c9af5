// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Init.hpp"
#include "Logging.hpp"
#include <llama.h>
#include <cstring>

namespace lmsvc::llama {

namespace log {
jalog::Scope scope("llama");
}

namespace {
void llamaLogCb(ggml_log_level level, const char* text, void* /*user_data*/) {
    auto len = strlen(text);

    auto jlvl = [&]() {
        switch (level) {
        case GGML_LOG_LEVEL_ERROR: return jalog::Level::Error;
        case GGML_LOG_LEVEL_WARN: return jalog::Level::Warning;
        case GGML_LOG_LEVEL_INFO: return jalog::Level::Info;
        case GGML_LOG_LEVEL_DEBUG: return jalog::Level::Debug;
        default: return jalog::Level::Debug; // continuation lines
        }
    }();

    // jalog entries are lines already
    if (len > 0 && text[len - 1] == '\n') {
        --len;
    }
    if (len == 0) {
        return;
    }

    log::scope.addEntry(jlvl, {text, len});
}
} // namespace

void initLibrary() {
    llama_log_set(llamaLogCb, nullptr);
    llama_backend_init();
    LMSVC_LLAMA_LOG(Info, "cpu info: ", llama_print_system_info());
}

} // namespace lmsvc::llama
