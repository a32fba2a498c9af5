// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <jalog/Scope.hpp>
#include <jalog/Log.hpp>

namespace lmsvc::llama::log {
extern jalog::Scope scope;
}

#define LMSVC_LLAMA_LOG(lvl, ...) JALOG_SCOPE(::lmsvc::llama::log::scope, lvl, __VA_ARGS__)
