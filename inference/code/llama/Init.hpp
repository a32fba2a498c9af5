// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"

namespace lmsvc::llama {

// initialize the llama.cpp backends and route their log output to the "llama" jalog scope
// call once before loading any models
LMSVC_LLAMA_API void initLibrary();

} // namespace lmsvc::llama
