// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <jalog/Scope.hpp>
#include <jalog/Log.hpp>

namespace lmsvc::rpc::log {
extern jalog::Scope scope;
}

#define LMSVC_RPC_LOG(lvl, ...) JALOG_SCOPE(::lmsvc::rpc::log::scope, lvl, __VA_ARGS__)
