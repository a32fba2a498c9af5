// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <llama/Init.hpp>
#include <llama/Model.hpp>
#include <llama/Instance.hpp>
#include <llama/Session.hpp>
#include <llama/Backend.hpp>

#include <core/RequestMediator.hpp>
#include <core/PromptFormatter.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

// LMSVC_TEST_MODEL is the path to a small chat gguf model, defined by the build
const char* TestModel = LMSVC_TEST_MODEL;

struct GlobalFixture {
    GlobalFixture() {
        lmsvc::llama::initLibrary();
    }
};

GlobalFixture globalFixture;

using namespace lmsvc;

TEST_CASE("missing model") {
    CHECK_THROWS_AS(llama::Model("no-such-model.gguf", {}), std::runtime_error);
}

TEST_CASE("vocab only") {
    llama::Model model(TestModel, {.vocabOnly = true});
    CHECK(!!model.lmodel());
    CHECK(model.params().vocabOnly);

    auto& vocab = model.vocab();
    CHECK(vocab.nTokens() > 0);

    auto tokens = vocab.tokenize("hello world", false, false);
    REQUIRE(!tokens.empty());
    std::string text;
    for (auto t : tokens) {
        text += vocab.tokenToString(t, false);
    }
    CHECK(text.find("hello world") != std::string::npos);

    // no weights, no instance
    CHECK_THROWS_AS(llama::Instance(model, {}), std::runtime_error);
}

TEST_CASE("session") {
    llama::Model model(TestModel, {.gpu = false});
    llama::Instance inst(model, {.ctxSize = 512});
    inst.warmup();
    CHECK(inst.ctxLength() == 512);

    inst.resetSampler({.greedy = true});
    auto& s = inst.startSession();
    CHECK_THROWS_AS(inst.startSession(), std::runtime_error);

    auto tokens = model.vocab().tokenize("The capital of France is", true, true);
    s.setInitialPrompt(tokens);
    CHECK(s.numPast() == tokens.size());
    CHECK_THROWS_AS(s.setInitialPrompt(tokens), std::runtime_error);

    auto t = s.getToken();
    CHECK(t != llama::Token_Invalid);
    inst.stopSession();

    // prompt longer than the context
    std::vector<llama::Token> longPrompt(600, tokens.back());
    auto& s2 = inst.startSession();
    CHECK_THROWS_AS(s2.setInitialPrompt(longPrompt), std::runtime_error);
    inst.stopSession();
}

TEST_CASE("backend") {
    auto model = std::make_shared<llama::Model>(TestModel, llama::Model::Params{.gpu = false});
    llama::Backend backend(model, {.ctxSize = 1024});

    const auto prompt = core::PromptFormatter::formatGeneration("Say hello.");

    SUBCASE("greedy is deterministic") {
        core::SamplingConfig cfg = {.maxLength = 80, .temperature = 0.1f, .repetitionPenalty = 1.1f, .doSample = false};
        auto a = backend.sample(prompt, cfg);
        auto b = backend.sample(prompt, cfg);
        CHECK(a.starts_with(prompt));
        CHECK(a == b);
    }

    SUBCASE("seeded sampling") {
        core::SamplingConfig cfg = {.maxLength = 80, .temperature = 0.7f, .topK = 50, .topP = 0.95f,
            .repetitionPenalty = 1.1f, .seed = 7};
        auto a = backend.sample(prompt, cfg);
        auto b = backend.sample(prompt, cfg);
        CHECK(a == b);
    }

    SUBCASE("no budget") {
        core::SamplingConfig cfg = {.maxLength = 2};
        CHECK(backend.sample(prompt, cfg) == prompt);
    }
}

TEST_CASE("mediator on llama") {
    auto model = std::make_shared<llama::Model>(TestModel, llama::Model::Params{.gpu = false});
    auto backend = std::make_unique<llama::Backend>(model, llama::Instance::InitParams{.ctxSize = 1024});
    core::RequestMediator mediator(std::move(backend), llama::makeTokenizerAdapter(model), {.seed = 1});

    auto gen = mediator.generateText({.prompt = "Hello, how are you?", .maxLength = 100});
    REQUIRE(gen);
    CHECK(gen->inputTokens >= 1);
    CHECK(gen->generatedTokens >= 0);
    CHECK(gen->generationTime >= 0);

    const std::vector<std::string> labels = {"positive", "negative", "neutral"};
    auto cls = mediator.classifyText({.text = "I love this product!", .labels = labels});
    REQUIRE(cls);
    CHECK(std::find(labels.begin(), labels.end(), cls->label) != labels.end());
    CHECK(cls->confidence > 0);
}
