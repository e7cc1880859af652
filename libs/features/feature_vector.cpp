/**
 * @file feature_vector.cpp
 * @brief Feature names and value access
 */

#include "qoeguard/feature_vector.hpp"

#include <algorithm>

namespace qoeguard::features {

std::string_view feature_name(Feature feature) noexcept
{
    switch (feature) {
        case Feature::kAddedFields:
            return "added_fields";
        case Feature::kRemovedFields:
            return "removed_fields";
        case Feature::kTypeChanges:
            return "type_changes";
        case Feature::kValueChanges:
            return "value_changes";
        case Feature::kNumericDeltaSum:
            return "numeric_delta_sum";
        case Feature::kNumericDeltaMax:
            return "numeric_delta_max";
        case Feature::kArrayLenChanges:
            return "array_len_changes";
        case Feature::kCriticalChanges:
            return "critical_changes";
    }
    return "unknown";
}

std::optional<Feature> feature_from_name(std::string_view name) noexcept
{
    const auto it = std::ranges::find(kAllFeatures, name, feature_name);
    if (it == kAllFeatures.end()) {
        return std::nullopt;
    }
    return *it;
}

double FeatureVector::value(Feature feature) const noexcept
{
    switch (feature) {
        case Feature::kAddedFields:
            return static_cast<double>(added_fields);
        case Feature::kRemovedFields:
            return static_cast<double>(removed_fields);
        case Feature::kTypeChanges:
            return static_cast<double>(type_changes);
        case Feature::kValueChanges:
            return static_cast<double>(value_changes);
        case Feature::kNumericDeltaSum:
            return numeric_delta_sum;
        case Feature::kNumericDeltaMax:
            return numeric_delta_max;
        case Feature::kArrayLenChanges:
            return static_cast<double>(array_len_changes);
        case Feature::kCriticalChanges:
            return static_cast<double>(critical_changes);
    }
    return 0.0;
}

bool FeatureVector::is_zero() const noexcept
{
    return std::ranges::all_of(kAllFeatures, [this](Feature f) { return value(f) == 0.0; });
}

}  // namespace qoeguard::features
