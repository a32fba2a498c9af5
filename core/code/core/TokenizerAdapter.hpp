// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <itlib/ufunction.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace lmsvc::core {

// token counts for response metadata, computed with a backend's tokenizer
class TokenizerAdapter {
public:
    using EncodeFunc = itlib::ufunction<std::vector<int32_t>(std::string_view)>;

    explicit TokenizerAdapter(EncodeFunc encode);

    int32_t countTokens(std::string_view text);

private:
    EncodeFunc m_encode;
};

} // namespace lmsvc::core
