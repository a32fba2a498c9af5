// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <memory>

namespace lmsvc::util {

// owning pointer to an object allocated by a C api with a free function
// used for llama_model, llama_context and llama_sampler
template <typename T>
using c_unique_ptr = std::unique_ptr<T, void(*)(T*)>;

} // namespace lmsvc::util
