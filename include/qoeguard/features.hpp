#pragma once

/**
 * @file features.hpp
 * @brief Reduce a change list to a fixed-shape feature vector
 */

#include "qoeguard/config.hpp"
#include "qoeguard/diff.hpp"
#include "qoeguard/feature_vector.hpp"

#include <string>
#include <vector>

namespace qoeguard::features {

/**
 * @brief A change that matched a criticality rule with non-zero weight
 */
struct CriticalEvidence
{
    diff::Change change;
    double criticality = 0.0;
    std::string pattern;  ///< Matching rule as written in configuration
};

struct Extraction
{
    FeatureVector features;
    std::vector<CriticalEvidence> critical_evidence;  ///< In change-list order
};

/**
 * @brief Count and aggregate changes
 *
 * Length markers only count toward array_len_changes. Every other change
 * counts toward exactly one of added/removed/type/value; numeric deltas of
 * value changes are summed and maxed with saturation. A change is critical
 * when the first criticality rule matching its path has a weight above zero.
 *
 * Pure: the same inputs always give the same output.
 */
[[nodiscard]] Extraction extract(const diff::ChangeList& changes,
                                 const config::CriticalityConfig& criticality);

}  // namespace qoeguard::features
