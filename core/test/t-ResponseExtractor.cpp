// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <core/ResponseExtractor.hpp>
#include <core/PromptFormatter.hpp>
#include <doctest/doctest.h>

using lmsvc::core::ResponseExtractor;
using lmsvc::core::PromptFormatter;

TEST_CASE("extract reply") {
    ResponseExtractor ex;
    CHECK(ex.delimiter() == "<|assistant|>");

    auto raw = PromptFormatter::formatGeneration("Hello") + "\n  I am fine, thanks!  \n";
    CHECK(ex.hasDelimiter(raw));
    CHECK(ex.extract(raw) == "I am fine, thanks!");

    // last delimiter wins
    CHECK(ex.extract("a<|assistant|>b<|assistant|> c ") == "c");

    // quotes
    CHECK(ex.extract("<|assistant|> \"positive\" ") == "positive");
    CHECK(ex.extract("<|assistant|>'negative'") == "negative");
    CHECK(ex.extract("<|assistant|>\"unbalanced") == "\"unbalanced");

    // nothing generated
    CHECK(ex.extract(PromptFormatter::formatGeneration("Hello")) == "");
}

TEST_CASE("extract without delimiter") {
    ResponseExtractor ex;
    CHECK_FALSE(ex.hasDelimiter("no delimiter present"));
    CHECK(ex.extract("no delimiter present") == "no delimiter present");
    CHECK(ex.extract("  no delimiter present \n") == "no delimiter present");
    CHECK(ex.extract("") == "");
    CHECK(ex.extract("<|assistant") == "<|assistant");
}

TEST_CASE("custom delimiter") {
    ResponseExtractor ex("Category:");
    CHECK(ex.extract("Text: x\n\nCategory: spam") == "spam");

    ResponseExtractor none("");
    CHECK_FALSE(none.hasDelimiter("anything"));
    CHECK(none.extract(" anything ") == "anything");
}
