/**
 * @file report.cpp
 * @brief Report documents, summaries and CI annotations
 */

#include "qoeguard/report.hpp"

#include "qoeguard/canonical_json.hpp"
#include "qoeguard/json_value.hpp"
#include "qoeguard/version.hpp"

#include <cstdint>
#include <format>
#include <fstream>
#include <print>
#include <ranges>
#include <type_traits>
#include <variant>

namespace qoeguard::report {

namespace {

[[nodiscard]] std::string compact(const JsonValue& value)
{
    return json::to_nlohmann(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

[[nodiscard]] std::string format_feature_value(const features::FeatureVector& fv,
                                               features::Feature feature)
{
    if (feature == features::Feature::kNumericDeltaSum
        || feature == features::Feature::kNumericDeltaMax) {
        return std::format("{:.4f}", fv.value(feature));
    }
    return std::format("{}", static_cast<std::uint64_t>(fv.value(feature)));
}

[[nodiscard]] std::string describe_change(const diff::Change& change)
{
    std::string text =
        std::format("{} {}", change.path.to_string(), diff::change_kind_name(change.kind));
    if (change.old_value && change.new_value) {
        text += std::format(": {} -> {}", compact(*change.old_value), compact(*change.new_value));
    }
    return text;
}

[[nodiscard]] std::string describe_signal(const policy::Signal& signal)
{
    return std::visit(
        [](const auto& s) -> std::string {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, policy::FeatureSignal>) {
                return std::format("feature {} = {} (contribution {:+.4f})",
                                   features::feature_name(s.feature),
                                   s.value,
                                   s.contribution);
            } else {
                return std::format("change {} [critical {:.2f} via {}] (contribution {:+.4f})",
                                   describe_change(s.change),
                                   s.criticality,
                                   s.pattern,
                                   s.contribution);
            }
        },
        signal);
}

/// Escape data for a GitHub workflow command
[[nodiscard]] std::string escape_annotation(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '%':
                out += "%25";
                break;
            case '\r':
                out += "%0D";
                break;
            case '\n':
                out += "%0A";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

}  // namespace

std::optional<OutputFormat> output_format_from_name(std::string_view name) noexcept
{
    if (name == "summary") {
        return OutputFormat::kSummary;
    }
    if (name == "json") {
        return OutputFormat::kJson;
    }
    if (name == "github") {
        return OutputFormat::kGithub;
    }
    return std::nullopt;
}

nlohmann::json change_to_json(const diff::Change& change)
{
    nlohmann::json j = {
        {"path", change.path.to_string()},
        {"kind", std::string(diff::change_kind_name(change.kind))},
    };
    if (change.old_value) {
        j["old"] = json::to_nlohmann(*change.old_value);
    }
    if (change.new_value) {
        j["new"] = json::to_nlohmann(*change.new_value);
    }
    if (change.numeric_delta) {
        j["numeric_delta"] = *change.numeric_delta;
    }
    if (change.is_length_marker()) {
        j["length_marker"] = true;
    }
    return j;
}

nlohmann::json changes_to_json(const diff::ChangeList& changes)
{
    nlohmann::json items = nlohmann::json::array();
    for (const auto& change : changes) {
        items.push_back(change_to_json(change));
    }
    return nlohmann::json{
        {"schema_version", kChangesSchemaVersion},
        {"change_count", changes.size()},
        {"changes", std::move(items)},
    };
}

nlohmann::json features_to_json(const features::FeatureVector& fv)
{
    return nlohmann::json{
        {"added_fields", fv.added_fields},
        {"removed_fields", fv.removed_fields},
        {"type_changes", fv.type_changes},
        {"value_changes", fv.value_changes},
        {"numeric_delta_sum", fv.numeric_delta_sum},
        {"numeric_delta_max", fv.numeric_delta_max},
        {"array_len_changes", fv.array_len_changes},
        {"critical_changes", fv.critical_changes},
    };
}

nlohmann::json signal_to_json(const policy::Signal& signal)
{
    if (const auto* feature = std::get_if<policy::FeatureSignal>(&signal)) {
        return nlohmann::json{
            {"type", "feature"},
            {"feature", std::string(features::feature_name(feature->feature))},
            {"value", feature->value},
            {"contribution", feature->contribution},
        };
    }
    const auto& change = std::get<policy::ChangeSignal>(signal);
    nlohmann::json j = change_to_json(change.change);
    j["type"] = "change";
    j["criticality"] = change.criticality;
    j["pattern"] = change.pattern;
    j["contribution"] = change.contribution;
    return j;
}

nlohmann::json evaluation_to_json(const pipeline::Evaluation& evaluation,
                                  const config::PolicyConfig& policy_config)
{
    const policy::Decision& decision = evaluation.decision;

    nlohmann::json contributions = nlohmann::json::object();
    for (const auto& contribution : decision.score.contributions) {
        contributions[std::string(features::feature_name(contribution.feature))] =
            contribution.value;
    }

    nlohmann::json signals = nlohmann::json::array();
    for (const auto& signal : decision.top_signals) {
        signals.push_back(signal_to_json(signal));
    }

    nlohmann::json overrides = nlohmann::json::array();
    for (const auto& rule : policy_config.overrides()) {
        overrides.push_back(nlohmann::json{
            {"name", rule.name},
            {"rule", rule.describe()},
        });
    }

    nlohmann::json model = {
        {"name", decision.score.model},
        {"baseline", decision.score.baseline},
    };
    if (decision.score.z) {
        model["z"] = *decision.score.z;
    }

    nlohmann::json report = {
        {"schema_version", kReportSchemaVersion},
        {"tool", {{"name", "qoeguard"}, {"version", kVersion}}},
        {"verdict", std::string(config::verdict_name(decision.verdict))},
        {"risk_score", decision.risk},
        {"model", std::move(model)},
        {"override_rule", nullptr},
        {"features", features_to_json(decision.features)},
        {"contributions", std::move(contributions)},
        {"top_signals", std::move(signals)},
        {"change_count", evaluation.changes.size()},
        {"ignored_change_count", evaluation.ignored_change_count},
        {"changes", changes_to_json(evaluation.changes).at("changes")},
        {"policy",
         {{"name", policy_config.name()},
          {"warn_threshold", policy_config.warn_threshold()},
          {"fail_threshold", policy_config.fail_threshold()},
          {"top_n", policy_config.top_n()},
          {"overrides", std::move(overrides)}}},
    };
    if (decision.override_rule) {
        report["override_rule"] = *decision.override_rule;
    }
    return report;
}

std::vector<std::string> render_summary(const pipeline::Evaluation& evaluation,
                                        const config::PolicyConfig& policy_config)
{
    const policy::Decision& decision = evaluation.decision;
    std::vector<std::string> lines;
    lines.push_back(std::format("QoE-Guard verdict: {} (risk {:.4f}, model {})",
                                config::verdict_name(decision.verdict),
                                decision.risk,
                                decision.score.model));
    lines.push_back(std::format("policy: {} (warn >= {:.2f}, fail >= {:.2f})",
                                policy_config.name(),
                                policy_config.warn_threshold(),
                                policy_config.fail_threshold()));
    if (decision.override_rule) {
        lines.push_back(std::format("override: {}", *decision.override_rule));
    }
    lines.push_back(std::format("changes: {} (ignored {})",
                                evaluation.changes.size(),
                                evaluation.ignored_change_count));

    lines.emplace_back("features:");
    for (features::Feature feature : features::kAllFeatures) {
        lines.push_back(std::format("  {}: {} (contribution {:+.4f})",
                                    features::feature_name(feature),
                                    format_feature_value(decision.features, feature),
                                    decision.score.contribution(feature)));
    }

    if (!decision.top_signals.empty()) {
        lines.emplace_back("top signals:");
        for (auto [i, signal] : std::views::enumerate(decision.top_signals)) {
            lines.push_back(std::format("  {}. {}", i + 1, describe_signal(signal)));
        }
    }
    return lines;
}

std::vector<std::string> render_github(const pipeline::Evaluation& evaluation)
{
    const policy::Decision& decision = evaluation.decision;
    std::vector<std::string> lines;
    lines.push_back(
        std::format("::set-output name=decision::{}", config::verdict_name(decision.verdict)));
    lines.push_back(std::format("::set-output name=risk_score::{:.4f}", decision.risk));
    lines.push_back(std::format("::set-output name=change_count::{}", evaluation.changes.size()));

    switch (decision.verdict) {
        case config::Verdict::kFail:
            lines.push_back(std::format("::error::QoE-Guard FAIL - Risk score {:.4f}{}",
                                        decision.risk,
                                        decision.override_rule
                                            ? " (override " + *decision.override_rule + ")"
                                            : std::string{}));
            break;
        case config::Verdict::kWarn:
            lines.push_back(std::format("::warning::QoE-Guard WARN - Risk score {:.4f}", decision.risk));
            break;
        case config::Verdict::kPass:
            lines.push_back(std::format("::notice::QoE-Guard PASS - Risk score {:.4f}", decision.risk));
            break;
    }

    for (const auto& change : evaluation.changes) {
        if (change.kind == diff::ChangeKind::kTypeChanged) {
            lines.push_back(std::format("::error title=Type change::{}",
                                        escape_annotation(describe_change(change))));
        } else if (change.kind == diff::ChangeKind::kRemoved) {
            lines.push_back(std::format("::warning title=Removed field::{}",
                                        escape_annotation(change.path.to_string())));
        }
    }
    return lines;
}

qoeguard::VoidResult write_json_output(const std::filesystem::path& path,
                                       const nlohmann::json& payload)
{
    auto canonical = canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            qoeguard::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *canonical << "\n";
    if (!out) {
        return std::unexpected(
            qoeguard::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

qoeguard::VoidResult write_text_output(const std::optional<std::filesystem::path>& path,
                                       const std::vector<std::string>& lines)
{
    if (!path) {
        for (const auto& line : lines) {
            std::println("{}", line);
        }
        return {};
    }
    std::ofstream out(*path);
    if (!out) {
        return std::unexpected(
            qoeguard::Error::make("IOError", "Failed to open output file: " + path->string()));
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(
            qoeguard::Error::make("IOError", "Failed to write output file: " + path->string()));
    }
    return {};
}

}  // namespace qoeguard::report
