/**
 * @file policy.cpp
 * @brief Threshold bands, overrides and evidence ranking
 */

#include "qoeguard/policy.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>

namespace qoeguard::policy {

namespace {

[[nodiscard]] std::vector<Signal> rank_signals(const scoring::Score& score,
                                               const features::Extraction& extraction,
                                               std::size_t top_n)
{
    std::vector<Signal> signals;
    for (features::Feature feature : features::kAllFeatures) {
        const double contribution = score.contribution(feature);
        if (contribution == 0.0) {
            continue;
        }
        signals.emplace_back(FeatureSignal{
            .feature = feature,
            .value = extraction.features.value(feature),
            .contribution = contribution,
        });
    }

    // Critical changes split the critical_changes contribution by criticality weight.
    double total_criticality = 0.0;
    for (const auto& evidence : extraction.critical_evidence) {
        total_criticality = common::saturating_add(total_criticality, evidence.criticality);
    }
    const double critical_contribution = score.contribution(features::Feature::kCriticalChanges);
    for (const auto& evidence : extraction.critical_evidence) {
        const double share = total_criticality > 0.0
                                 ? critical_contribution * (evidence.criticality / total_criticality)
                                 : 0.0;
        signals.emplace_back(ChangeSignal{
            .change = evidence.change,
            .criticality = evidence.criticality,
            .pattern = evidence.pattern,
            .contribution = share,
        });
    }

    std::ranges::stable_sort(signals, [](const Signal& a, const Signal& b) {
        return std::fabs(signal_contribution(a)) > std::fabs(signal_contribution(b));
    });
    if (signals.size() > top_n) {
        signals.resize(top_n);
    }
    return signals;
}

}  // namespace

double signal_contribution(const Signal& signal) noexcept
{
    return std::visit([](const auto& s) { return s.contribution; }, signal);
}

config::Verdict band_for(double risk, const config::PolicyConfig& policy) noexcept
{
    if (risk >= policy.fail_threshold()) {
        return config::Verdict::kFail;
    }
    if (risk >= policy.warn_threshold()) {
        return config::Verdict::kWarn;
    }
    return config::Verdict::kPass;
}

Decision decide(const scoring::Score& score,
                const features::Extraction& extraction,
                const config::PolicyConfig& policy)
{
    Decision decision{
        .verdict = band_for(score.risk, policy),
        .risk = score.risk,
        .features = extraction.features,
        .score = score,
        .override_rule = std::nullopt,
        .top_signals = rank_signals(score, extraction, policy.top_n()),
    };

    const auto& overrides = policy.overrides();
    const auto it = std::ranges::find_if(overrides, [&extraction](const config::OverrideRule& rule) {
        return rule.matches(extraction.features);
    });
    if (it != overrides.end()) {
        decision.verdict = it->outcome;
        decision.override_rule = it->name;
    }
    return decision;
}

}  // namespace qoeguard::policy
