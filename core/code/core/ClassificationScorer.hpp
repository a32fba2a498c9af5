// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace lmsvc::core {

// confidence assigned by each tier
// uncalibrated: they rank the tiers and carry no statistical meaning
struct ScoringConfig {
    double exactConfidence = 0.95;
    double containsConfidence = 0.7;
    double fallbackConfidence = 0.3;
};

enum class MatchTier {
    Exact,    // reply equals a label
    Contains, // reply contains a label
    Fallback, // nothing matched, first label
};

std::string_view tierName(MatchTier tier) noexcept;

struct Score {
    std::string label;
    double confidence = 0;
    MatchTier tier = MatchTier::Fallback;
};

// tiers
// all comparisons are case insensitive and ties go to the earliest label
std::optional<Score> matchExact(std::string_view reply, std::span<const std::string> labels, const ScoringConfig& config);
std::optional<Score> matchContains(std::string_view reply, std::span<const std::string> labels, const ScoringConfig& config);
std::optional<Score> matchFallback(std::string_view reply, std::span<const std::string> labels, const ScoringConfig& config);

// turns a free-form model reply into one of the labels
// tiers are tried in order: exact, contains, fallback
class ClassificationScorer {
public:
    using Matcher = std::optional<Score>(*)(std::string_view, std::span<const std::string>, const ScoringConfig&);

    struct Strategy {
        MatchTier tier;
        Matcher match;
    };

    // throws if a confidence is outside of [0, 1]
    explicit ClassificationScorer(ScoringConfig config = {});

    // the returned label is always an element of labels
    // throws if labels is empty
    Score score(std::string_view reply, std::span<const std::string> labels) const;

    const ScoringConfig& config() const noexcept { return m_config; }

    static std::span<const Strategy> strategies() noexcept;
private:
    ScoringConfig m_config;
};

} // namespace lmsvc::core
