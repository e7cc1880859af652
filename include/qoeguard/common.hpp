#pragma once

/**
 * @file common.hpp
 * @brief Common types: error reporting, Result aliases, saturating arithmetic
 */

#include <cmath>
#include <expected>
#include <limits>
#include <string>
#include <utility>

namespace qoeguard {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace qoeguard

namespace qoeguard::common {

// ============================================================================
// Saturating arithmetic
// ============================================================================

inline constexpr double kSaturationLimit = std::numeric_limits<double>::max();

/**
 * Clamp a value into [-max, max]. NaN collapses to 0.
 */
[[nodiscard]] inline double saturate(double value) noexcept
{
    if (std::isnan(value)) {
        return 0.0;
    }
    if (value > kSaturationLimit) {
        return kSaturationLimit;
    }
    if (value < -kSaturationLimit) {
        return -kSaturationLimit;
    }
    return value;
}

/**
 * Add two finite values, saturating at +/- DBL_MAX instead of overflowing to inf.
 */
[[nodiscard]] inline double saturating_add(double a, double b) noexcept
{
    return saturate(a + b);
}

/**
 * Absolute difference |b - a|, saturated.
 */
[[nodiscard]] inline double saturating_abs_delta(double a, double b) noexcept
{
    return saturate(std::fabs(b - a));
}

}  // namespace qoeguard::common
