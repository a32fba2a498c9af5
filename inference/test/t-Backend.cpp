// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <llama/Backend.hpp>
#include <llama.h>
#include <doctest/doctest.h>

using lmsvc::llama::Backend;
using lmsvc::core::SamplingConfig;

TEST_CASE("sampler params from generation config") {
    SamplingConfig cfg = {
        .maxLength = 100,
        .temperature = 0.7f,
        .topK = 50,
        .topP = 0.95f,
        .repetitionPenalty = 1.1f,
        .doSample = true,
        .seed = 42,
    };

    auto params = Backend::samplerParamsFrom(cfg);
    CHECK(params.rngSeed == 42);
    CHECK(params.topK == 50);
    CHECK(params.topP == doctest::Approx(0.95));
    CHECK(params.temp == doctest::Approx(0.7));
    CHECK(params.repetitionPenalty.repeat == doctest::Approx(1.1));
    CHECK(params.repetitionPenalty.numTokens > 0);
    CHECK_FALSE(params.greedy);
}

TEST_CASE("sampler params from classification config") {
    SamplingConfig cfg = {
        .maxLength = 80,
        .temperature = 0.1f,
        .topK = 0,
        .topP = 1.f,
        .repetitionPenalty = 1.1f,
        .doSample = false,
    };

    auto params = Backend::samplerParamsFrom(cfg);
    CHECK(params.greedy);
    CHECK(params.rngSeed == LLAMA_DEFAULT_SEED); // no seed = random
    CHECK(params.topK == 0);
}

TEST_CASE("token budget") {
    SamplingConfig cfg = {.maxLength = 100};
    CHECK(Backend::tokenBudget(cfg, 30) == 70);
    CHECK(Backend::tokenBudget(cfg, 100) == 0);
    CHECK(Backend::tokenBudget(cfg, 120) == -20);

    // the margin is counted from the backend's own prompt tokens, whatever maxLength says
    cfg.maxLength = 80;
    cfg.maxNewTokens = 50;
    CHECK(Backend::tokenBudget(cfg, 30) == 50);
    CHECK(Backend::tokenBudget(cfg, 200) == 50);

    cfg.maxNewTokens = 0;
    CHECK(Backend::tokenBudget(cfg, 30) == 0);
}
