#pragma once

/**
 * @file version.hpp
 * @brief QoE-Guard version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace qoeguard {

/// QoE-Guard version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions (embedded in all outputs)
constexpr const char* kConfigSchemaVersion = "qoeguard.config.v1";
constexpr const char* kReportSchemaVersion = "qoeguard.report.v1";
constexpr const char* kChangesSchemaVersion = "qoeguard.changes.v1";

}  // namespace qoeguard
