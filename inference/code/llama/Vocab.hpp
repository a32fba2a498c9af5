// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Token.hpp"
#include <vector>
#include <string>
#include <string_view>

struct llama_vocab;
namespace lmsvc::llama {

class Model;

class LMSVC_LLAMA_API Vocab {
public:
    Vocab(const Model& model);
    ~Vocab();

    // addSpecial adds bos/eos as configured by the model
    // parseSpecial makes control tokens in the text (like "<|assistant|>") map to their ids instead of being split
    std::vector<Token> tokenize(std::string_view text, bool addSpecial, bool parseSpecial) const;

    bool isEog(Token token) const noexcept;
    int32_t nTokens() const noexcept;

    std::string tokenToString(Token token, bool special = true) const;

    const llama_vocab* lvocab() const { return m_lVocab; }
private:
    const llama_vocab* m_lVocab;
};

} // namespace lmsvc::llama
