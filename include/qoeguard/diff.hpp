#pragma once

/**
 * @file diff.hpp
 * @brief Hierarchical diff of two JSON values into path-keyed change records
 */

#include "qoeguard/json_value.hpp"
#include "qoeguard/path.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace qoeguard::diff {

enum class ChangeKind : std::uint8_t {
    kAdded,
    kRemoved,
    kTypeChanged,
    kValueChanged
};

/**
 * @brief Stable snake_case name ("added", "removed", "type_changed", "value_changed")
 */
[[nodiscard]] std::string_view change_kind_name(ChangeKind kind) noexcept;

/**
 * @brief One detected difference between baseline and candidate
 *
 * old_value is absent iff kind is kAdded; new_value is absent iff kind is
 * kRemoved. numeric_delta is set when both sides are numbers.
 */
struct Change
{
    Path path;
    ChangeKind kind = ChangeKind::kValueChanged;
    std::optional<JsonValue> old_value;
    std::optional<JsonValue> new_value;
    std::optional<double> numeric_delta;

    /// Synthetic array cardinality change (old/new are the lengths)
    [[nodiscard]] bool is_length_marker() const noexcept { return path.is_length_marker(); }

    bool operator==(const Change&) const = default;
};

using ChangeList = std::vector<Change>;

/**
 * @brief Compare two JSON values
 *
 * Depth-first pre-order over the baseline's key/index order. At each object
 * level, keys added by the candidate follow the shared and removed keys, in
 * candidate order. Arrays are compared index-wise; a length difference emits
 * one length-marker change before the element changes. A variant mismatch is
 * always a type change, never a value change.
 *
 * Total: every pair of values yields a (possibly empty) list.
 */
[[nodiscard]] ChangeList diff(const JsonValue& baseline, const JsonValue& candidate);

}  // namespace qoeguard::diff
