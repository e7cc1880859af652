#pragma once

/**
 * @file report.hpp
 * @brief Machine- and human-readable renderings of an evaluation
 */

#include "qoeguard/common.hpp"
#include "qoeguard/config.hpp"
#include "qoeguard/diff.hpp"
#include "qoeguard/feature_vector.hpp"
#include "qoeguard/pipeline.hpp"
#include "qoeguard/policy.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace qoeguard::report {

enum class OutputFormat { kSummary, kJson, kGithub };

[[nodiscard]] std::optional<OutputFormat> output_format_from_name(std::string_view name) noexcept;

[[nodiscard]] nlohmann::json change_to_json(const diff::Change& change);

/// {"changes": [...], "change_count": N, "schema_version": ...}
[[nodiscard]] nlohmann::json changes_to_json(const diff::ChangeList& changes);

[[nodiscard]] nlohmann::json features_to_json(const features::FeatureVector& fv);

[[nodiscard]] nlohmann::json signal_to_json(const policy::Signal& signal);

/**
 * @brief Full `qoeguard.report.v1` document
 *
 * Contains no timestamps or host data, so identical inputs serialize to
 * identical bytes.
 */
[[nodiscard]] nlohmann::json evaluation_to_json(const pipeline::Evaluation& evaluation,
                                                const config::PolicyConfig& policy_config);

[[nodiscard]] std::vector<std::string> render_summary(const pipeline::Evaluation& evaluation,
                                                      const config::PolicyConfig& policy_config);

/// GitHub Actions workflow commands (annotations and outputs)
[[nodiscard]] std::vector<std::string> render_github(const pipeline::Evaluation& evaluation);

/// Write canonical JSON followed by a newline
[[nodiscard]] qoeguard::VoidResult write_json_output(const std::filesystem::path& path,
                                                     const nlohmann::json& payload);

/// Write lines to `path`, or to stdout when no path is given
[[nodiscard]] qoeguard::VoidResult
write_text_output(const std::optional<std::filesystem::path>& path,
                  const std::vector<std::string>& lines);

}  // namespace qoeguard::report
