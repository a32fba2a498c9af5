// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "TokenizerAdapter.hpp"

#include <util/throw_ex.hpp>

namespace lmsvc::core {

TokenizerAdapter::TokenizerAdapter(EncodeFunc encode)
    : m_encode(std::move(encode))
{
    if (!m_encode) {
        throw_ex{} << "TokenizerAdapter requires an encode function";
    }
}

int32_t TokenizerAdapter::countTokens(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    return int32_t(m_encode(text).size());
}

} // namespace lmsvc::core
