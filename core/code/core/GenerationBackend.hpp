// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "Types.hpp"

#include <string>
#include <string_view>

namespace lmsvc::core {

// a generative model which continues prompts
// implementations are not required to be thread safe
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    // continue the prompt up to config.maxLength total tokens
    // the returned text starts with the echoed prompt
    // throws on failure (out of memory, device errors, decode errors)
    virtual std::string sample(std::string_view prompt, const SamplingConfig& config) = 0;
};

} // namespace lmsvc::core
