#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for byte-stable reports
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Numbers must be finite; NaN and infinities are rejected
 */

#include "qoeguard/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace qoeguard::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string, or NonFiniteNumber / InvalidUtf8
 */
[[nodiscard]] qoeguard::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Check that every number in `j` is finite
 * @return Empty on success; the error names the first offending path
 */
[[nodiscard]] qoeguard::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace qoeguard::canonical
