// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <splat/symbol_export.h>

#if LMSVC_LLAMA_SHARED
#   if BUILDING_LMSVC_LLAMA
#       define LMSVC_LLAMA_API SYMBOL_EXPORT
#   else
#       define LMSVC_LLAMA_API SYMBOL_IMPORT
#   endif
#else
#   define LMSVC_LLAMA_API
#endif
