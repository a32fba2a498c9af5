// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Logging.hpp"

namespace lmsvc::core::log {
jalog::Scope scope("lmsvc");
}
