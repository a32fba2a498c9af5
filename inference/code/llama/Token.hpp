// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <cstdint>

namespace lmsvc::llama {
using Token = std::int32_t;
inline constexpr Token Token_Invalid = -1;
} // namespace lmsvc::llama
