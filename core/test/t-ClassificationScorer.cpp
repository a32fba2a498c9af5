// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <core/ClassificationScorer.hpp>
#include <doctest/doctest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lmsvc::core;

TEST_CASE("exact tier") {
    ClassificationScorer scorer;
    const std::vector<std::string> labels = {"positive", "negative", "neutral"};

    auto s = scorer.score("positive", labels);
    CHECK(s.label == "positive");
    CHECK(s.confidence == 0.95);
    CHECK(s.tier == MatchTier::Exact);

    s = scorer.score("  \"NEUTRAL\"\n", labels);
    CHECK(s.label == "neutral");
    CHECK(s.tier == MatchTier::Exact);

    // the label is returned as spelled in the request
    const std::vector<std::string> mixed = {"Spam", "Ham"};
    CHECK(scorer.score("ham", mixed).label == "Ham");
}

TEST_CASE("contains tier") {
    ClassificationScorer scorer;
    const std::vector<std::string> labels = {"positive", "negative"};

    auto s = scorer.score("I think this is positive overall", labels);
    CHECK(s.label == "positive");
    CHECK(s.confidence == 0.7);
    CHECK(s.tier == MatchTier::Contains);

    // first label in request order wins, regardless of position in the reply
    s = scorer.score("negative, or maybe positive", labels);
    CHECK(s.label == "positive");

    // only the second label occurs in the reply
    const std::vector<std::string> reversed = {"negative", "positive"};
    CHECK(scorer.score("not positive at all", reversed).label == "positive");

    CHECK(scorer.score("Category: NEGATIVE.", labels).label == "negative");
}

TEST_CASE("fallback tier") {
    ClassificationScorer scorer;
    const std::vector<std::string> labels = {"a", "b", "c"};

    auto s = scorer.score("xyz unrelated", labels);
    CHECK(s.label == "a");
    CHECK(s.confidence == 0.3);
    CHECK(s.tier == MatchTier::Fallback);

    CHECK(scorer.score("", labels).label == "a");
}

TEST_CASE("duplicates and case variants") {
    ClassificationScorer scorer;
    const std::vector<std::string> labels = {"Yes", "yes", "no"};
    auto s = scorer.score("yes", labels);
    CHECK(s.label == "Yes");
    CHECK(s.tier == MatchTier::Exact);
}

TEST_CASE("closure") {
    ClassificationScorer scorer;
    const std::vector<std::string> labels = {"sports", "politics", "tech"};
    const std::vector<std::string> replies = {
        "sports", "Tech", "it is about politics", "", "none of these", "\"sports\"", "technology",
    };
    for (auto& r : replies) {
        auto s = scorer.score(r, labels);
        CHECK(std::find(labels.begin(), labels.end(), s.label) != labels.end());
        CHECK(s.confidence >= 0);
        CHECK(s.confidence <= 1);
    }
}

TEST_CASE("strategies") {
    auto strategies = ClassificationScorer::strategies();
    REQUIRE(strategies.size() == 3);
    CHECK(strategies[0].tier == MatchTier::Exact);
    CHECK(strategies[1].tier == MatchTier::Contains);
    CHECK(strategies[2].tier == MatchTier::Fallback);

    ScoringConfig config;
    const std::vector<std::string> labels = {"x"};
    CHECK_FALSE(matchExact("y", labels, config));
    CHECK_FALSE(matchContains("y", labels, config));
    CHECK(matchFallback("y", labels, config));
    CHECK_FALSE(matchFallback("y", {}, config));

    CHECK(tierName(MatchTier::Contains) == "contains");
}

TEST_CASE("config") {
    ClassificationScorer scorer({.exactConfidence = 1, .containsConfidence = 0.5, .fallbackConfidence = 0});
    const std::vector<std::string> labels = {"a", "b"};
    CHECK(scorer.score("b", labels).confidence == 1);
    CHECK(scorer.score("xbx", labels).confidence == 0.5);
    CHECK(scorer.score("zzz", labels).confidence == 0);

    CHECK_THROWS_AS(ClassificationScorer({.exactConfidence = 1.5}), std::runtime_error);
    CHECK_THROWS_AS(ClassificationScorer({.fallbackConfidence = -0.1}), std::runtime_error);

    CHECK_THROWS_AS(scorer.score("a", {}), std::runtime_error);
}
