// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <jalog/Scope.hpp>
#include <jalog/Log.hpp>

namespace lmsvc::core::log {
extern jalog::Scope scope;
}

#define LMSVC_CORE_LOG(lvl, ...) JALOG_SCOPE(::lmsvc::core::log::scope, lvl, __VA_ARGS__)
