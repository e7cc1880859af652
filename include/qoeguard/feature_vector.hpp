#pragma once

/**
 * @file feature_vector.hpp
 * @brief Fixed-shape variance feature vector
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace qoeguard::features {

enum class Feature : std::uint8_t {
    kAddedFields,
    kRemovedFields,
    kTypeChanges,
    kValueChanges,
    kNumericDeltaSum,
    kNumericDeltaMax,
    kArrayLenChanges,
    kCriticalChanges
};

inline constexpr std::size_t kFeatureCount = 8;

/// Canonical feature order used by every report and contribution table
inline constexpr std::array<Feature, kFeatureCount> kAllFeatures = {
    Feature::kAddedFields,
    Feature::kRemovedFields,
    Feature::kTypeChanges,
    Feature::kValueChanges,
    Feature::kNumericDeltaSum,
    Feature::kNumericDeltaMax,
    Feature::kArrayLenChanges,
    Feature::kCriticalChanges,
};

[[nodiscard]] constexpr std::size_t feature_index(Feature feature) noexcept
{
    return static_cast<std::size_t>(feature);
}

/**
 * @brief snake_case feature name as used in configuration and reports
 */
[[nodiscard]] std::string_view feature_name(Feature feature) noexcept;

[[nodiscard]] std::optional<Feature> feature_from_name(std::string_view name) noexcept;

struct FeatureVector
{
    std::uint64_t added_fields = 0;
    std::uint64_t removed_fields = 0;
    std::uint64_t type_changes = 0;
    std::uint64_t value_changes = 0;
    double numeric_delta_sum = 0.0;
    double numeric_delta_max = 0.0;
    std::uint64_t array_len_changes = 0;
    std::uint64_t critical_changes = 0;

    /// Feature value as a double, for scoring and override predicates
    [[nodiscard]] double value(Feature feature) const noexcept;

    [[nodiscard]] bool is_zero() const noexcept;

    bool operator==(const FeatureVector&) const = default;
};

}  // namespace qoeguard::features
