// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <splat/pp_select.h>
#include <itlib/utility.hpp>

// [movecap(a, b)] is [a = itlib::move(a), b = itlib::move(b)]
#define I_LMSVC_MOVE_CAPTURE_ONE(a, i) a = ::itlib::move(a)

#define movecap(...) SPLAT_ITERATE_WITH(I_LMSVC_MOVE_CAPTURE_ONE, ##__VA_ARGS__)
