#pragma once

/**
 * @file policy.hpp
 * @brief Map a risk score to a verdict and rank the evidence behind it
 */

#include "qoeguard/config.hpp"
#include "qoeguard/diff.hpp"
#include "qoeguard/features.hpp"
#include "qoeguard/scoring.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qoeguard::policy {

/// A feature with a non-zero contribution
struct FeatureSignal
{
    features::Feature feature = features::Feature::kAddedFields;
    double value = 0.0;         ///< Raw feature value
    double contribution = 0.0;  ///< Signed score contribution

    bool operator==(const FeatureSignal&) const = default;
};

/// A critical change with its share of the critical_changes contribution
struct ChangeSignal
{
    diff::Change change;
    double criticality = 0.0;
    std::string pattern;
    double contribution = 0.0;

    bool operator==(const ChangeSignal&) const = default;
};

using Signal = std::variant<FeatureSignal, ChangeSignal>;

[[nodiscard]] double signal_contribution(const Signal& signal) noexcept;

struct Decision
{
    config::Verdict verdict = config::Verdict::kPass;
    double risk = 0.0;
    qoeguard::features::FeatureVector features;
    scoring::Score score;
    std::optional<std::string> override_rule;  ///< Name of the rule that forced the verdict
    std::vector<Signal> top_signals;           ///< At most policy.top_n(), strongest first
};

/**
 * @brief Verdict for a risk score alone, ignoring overrides
 *
 * risk >= fail => FAIL, otherwise risk >= warn => WARN, otherwise PASS.
 */
[[nodiscard]] config::Verdict band_for(double risk, const config::PolicyConfig& policy) noexcept;

/**
 * @brief Apply overrides (first match wins) and then thresholds
 *
 * Deterministic: identical inputs produce identical decisions, including the
 * order of top_signals.
 */
[[nodiscard]] Decision decide(const scoring::Score& score,
                              const features::Extraction& extraction,
                              const config::PolicyConfig& policy);

}  // namespace qoeguard::policy
