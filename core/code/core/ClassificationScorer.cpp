// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "ClassificationScorer.hpp"

#include <util/strings.hpp>
#include <util/throw_ex.hpp>

#include <array>
#include <stdexcept>

namespace lmsvc::core {

std::string_view tierName(MatchTier tier) noexcept {
    switch (tier) {
    case MatchTier::Exact: return "exact";
    case MatchTier::Contains: return "contains";
    case MatchTier::Fallback: return "fallback";
    }
    return "unknown";
}

std::optional<Score> matchExact(std::string_view reply, std::span<const std::string> labels, const ScoringConfig& config) {
    reply = util::trimQuoted(reply);
    for (auto& label : labels) {
        if (util::iequals(reply, util::trimQuoted(label))) {
            return Score{label, config.exactConfidence, MatchTier::Exact};
        }
    }
    return std::nullopt;
}

std::optional<Score> matchContains(std::string_view reply, std::span<const std::string> labels, const ScoringConfig& config) {
    for (auto& label : labels) {
        if (label.empty()) continue; // would match anything
        if (util::icontains(reply, label)) {
            return Score{label, config.containsConfidence, MatchTier::Contains};
        }
    }
    return std::nullopt;
}

std::optional<Score> matchFallback(std::string_view, std::span<const std::string> labels, const ScoringConfig& config) {
    if (labels.empty()) {
        return std::nullopt;
    }
    return Score{labels.front(), config.fallbackConfidence, MatchTier::Fallback};
}

namespace {
constexpr std::array<ClassificationScorer::Strategy, 3> Strategies = {{
    {MatchTier::Exact, matchExact},
    {MatchTier::Contains, matchContains},
    {MatchTier::Fallback, matchFallback},
}};

void checkConfidence(double value, std::string_view name) {
    if (!(value >= 0 && value <= 1)) {
        throw_ex{} << name << " confidence must be in [0, 1], got " << value;
    }
}
} // namespace

ClassificationScorer::ClassificationScorer(ScoringConfig config)
    : m_config(config)
{
    checkConfidence(m_config.exactConfidence, "exact");
    checkConfidence(m_config.containsConfidence, "contains");
    checkConfidence(m_config.fallbackConfidence, "fallback");
}

std::span<const ClassificationScorer::Strategy> ClassificationScorer::strategies() noexcept {
    return Strategies;
}

Score ClassificationScorer::score(std::string_view reply, std::span<const std::string> labels) const {
    if (labels.empty()) {
        throw_ex{} << "Cannot score a reply without labels";
    }

    for (auto& s : Strategies) {
        if (auto result = s.match(reply, labels, m_config)) {
            return std::move(*result);
        }
    }

    // fallback matches any non-empty label list
    throw std::logic_error("No scoring strategy produced a result");
}

} // namespace lmsvc::core
