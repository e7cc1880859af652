#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for QoE-Guard
 *
 * Include this header early in a translation unit (the CLI entry point does)
 * to get a clear diagnostic when the toolchain is too old.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "QoE-Guard requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::expected: Result<T> error handling
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "QoE-Guard requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// std::print / std::println: CLI output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "QoE-Guard requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

// std::views::enumerate: numbered report lines
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "QoE-Guard requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// std::format: report rendering
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "QoE-Guard requires std::format (__cpp_lib_format >= 202110L)."
#endif

#define QOEGUARD_CPP23_FEATURES_VERIFIED 1
