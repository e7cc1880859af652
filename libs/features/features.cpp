/**
 * @file features.cpp
 * @brief Feature extraction from diff output
 */

#include "qoeguard/features.hpp"

#include <algorithm>

namespace qoeguard::features {

Extraction extract(const diff::ChangeList& changes, const config::CriticalityConfig& criticality)
{
    Extraction result;
    FeatureVector& fv = result.features;

    for (const auto& change : changes) {
        if (change.is_length_marker()) {
            ++fv.array_len_changes;
        } else {
            switch (change.kind) {
                case diff::ChangeKind::kAdded:
                    ++fv.added_fields;
                    break;
                case diff::ChangeKind::kRemoved:
                    ++fv.removed_fields;
                    break;
                case diff::ChangeKind::kTypeChanged:
                    ++fv.type_changes;
                    break;
                case diff::ChangeKind::kValueChanged:
                    ++fv.value_changes;
                    if (change.numeric_delta) {
                        fv.numeric_delta_sum =
                            common::saturating_add(fv.numeric_delta_sum, *change.numeric_delta);
                        fv.numeric_delta_max = std::max(fv.numeric_delta_max, *change.numeric_delta);
                    }
                    break;
            }
        }

        const auto* rule = criticality.match(change.path);
        if (rule == nullptr || rule->weight <= 0.0) {
            continue;
        }
        ++fv.critical_changes;
        result.critical_evidence.push_back(CriticalEvidence{
            .change = change,
            .criticality = rule->weight,
            .pattern = rule->pattern.text(),
        });
    }
    return result;
}

}  // namespace qoeguard::features
