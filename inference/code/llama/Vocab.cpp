// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Vocab.hpp"
#include "Model.hpp"
#include <llama.h>
#include <util/throw_ex.hpp>
#include <type_traits>

namespace lmsvc::llama {

static_assert(std::is_same_v<Token, llama_token>);

Vocab::Vocab(const Model& model)
    : m_lVocab(llama_model_get_vocab(model.lmodel()))
{}
Vocab::~Vocab() = default;

bool Vocab::isEog(Token token) const noexcept {
    return llama_vocab_is_eog(m_lVocab, token);
}

int32_t Vocab::nTokens() const noexcept {
    return llama_vocab_n_tokens(m_lVocab);
}

std::vector<Token> Vocab::tokenize(std::string_view text, bool addSpecial, bool parseSpecial) const {
    int32_t numTokens = int32_t(text.length()) + 2 * addSpecial; // optimistic max
    std::vector<Token> ret(numTokens);
    numTokens = llama_tokenize(m_lVocab, text.data(), int32_t(text.length()), ret.data(), numTokens, addSpecial, parseSpecial);
    if (numTokens < 0) {
        ret.resize(-numTokens);
        const int check =
            llama_tokenize(m_lVocab, text.data(), int32_t(text.length()), ret.data(), -numTokens, addSpecial, parseSpecial);
        if (check != -numTokens) {
            throw_ex{} << "Tokenization mismatch: expected " << -numTokens << " tokens, got " << check;
        }
    }
    else {
        ret.resize(numTokens);
    }
    return ret;
}

std::string Vocab::tokenToString(Token token, bool special) const {
    std::string ret;

    auto toPiece = [&]() {
        return llama_token_to_piece(m_lVocab, token, ret.data(), int32_t(ret.size()), 0, special);
    };

    ret.resize(ret.capacity()); // make use of small string optimization
    const auto len = toPiece();
    if (len < 0) {
        ret.resize(-len);
        toPiece();
    }
    else {
        ret.resize(len);
    }

    return ret;
}

} // namespace lmsvc::llama
