#pragma once

/**
 * @file config.hpp
 * @brief Immutable criticality, weight, policy and model configuration
 *
 * Every configuration type is built through a validating factory and is never
 * mutated afterwards, so one instance can be shared by concurrent
 * evaluations. Malformed values are rejected here with an InvalidConfig
 * error; the pipeline itself never re-validates.
 */

#include "qoeguard/common.hpp"
#include "qoeguard/feature_vector.hpp"
#include "qoeguard/path.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace qoeguard::config {

// ============================================================================
// Criticality
// ============================================================================

struct CriticalityRule
{
    PathPattern pattern;
    double weight = 0.0;  ///< In [0,1]; 0 marks a non-critical carve-out
};

class CriticalityConfig
{
public:
    struct Entry
    {
        std::string pattern;
        double weight = 0.0;
    };

    /// Empty configuration: nothing is critical
    CriticalityConfig() = default;

    [[nodiscard]] static qoeguard::Result<CriticalityConfig> create(std::vector<Entry> entries);

    /// Streaming profile: playback, drm, entitlement, manifest, license, ads, auth
    [[nodiscard]] static CriticalityConfig streaming_defaults();

    [[nodiscard]] const std::vector<CriticalityRule>& rules() const noexcept { return m_rules; }

    /**
     * @brief First rule (in configured order) whose pattern prefixes `path`
     * @return Matching rule or nullptr
     */
    [[nodiscard]] const CriticalityRule* match(const Path& path) const noexcept;

private:
    explicit CriticalityConfig(std::vector<CriticalityRule> rules)
        : m_rules(std::move(rules))
    {}

    std::vector<CriticalityRule> m_rules;
};

// ============================================================================
// Weights
// ============================================================================

/**
 * @brief Linear weight of one feature plus its normalization
 *
 * The scored value is min(raw / scale, cap).
 */
struct FeatureWeight
{
    double weight = 0.0;
    double scale = 1.0;
    std::optional<double> cap;

    bool operator==(const FeatureWeight&) const = default;
};

class WeightConfig
{
public:
    using Table = std::array<FeatureWeight, features::kFeatureCount>;

    [[nodiscard]] static qoeguard::Result<WeightConfig>
    create(Table weights, double bias, bool allow_negative = false);

    /// critical 0.18, type 0.14, removed 0.10, added 0.05, array_len 0.07,
    /// delta_max 0.16 (/5, cap 10), delta_sum 0.06 (/10, cap 10),
    /// value 0.04 (/10, cap 10), bias -1.2
    [[nodiscard]] static WeightConfig defaults();

    [[nodiscard]] const FeatureWeight& weight(features::Feature feature) const noexcept
    {
        return m_weights[features::feature_index(feature)];
    }
    [[nodiscard]] const Table& table() const noexcept { return m_weights; }
    [[nodiscard]] double bias() const noexcept { return m_bias; }
    [[nodiscard]] bool allows_negative() const noexcept { return m_allow_negative; }

    /// Apply scale and cap to a raw feature value
    [[nodiscard]] double normalize(features::Feature feature, double raw) const noexcept;

private:
    WeightConfig(Table weights, double bias, bool allow_negative)
        : m_weights(weights)
        , m_bias(bias)
        , m_allow_negative(allow_negative)
    {}

    Table m_weights{};
    double m_bias = 0.0;
    bool m_allow_negative = false;
};

// ============================================================================
// Policy
// ============================================================================

enum class Verdict : std::uint8_t { kPass, kWarn, kFail };

/// "PASS", "WARN", "FAIL"
[[nodiscard]] std::string_view verdict_name(Verdict verdict) noexcept;
[[nodiscard]] std::optional<Verdict> verdict_from_name(std::string_view name) noexcept;

enum class Comparison : std::uint8_t { kGreaterEqual, kGreater, kLessEqual, kLess, kEqual };

/// ">=", ">", "<=", "<", "=="
[[nodiscard]] std::string_view comparison_symbol(Comparison op) noexcept;
[[nodiscard]] std::optional<Comparison> comparison_from_symbol(std::string_view symbol) noexcept;

struct Condition
{
    features::Feature feature = features::Feature::kCriticalChanges;
    Comparison op = Comparison::kGreaterEqual;
    double threshold = 0.0;

    [[nodiscard]] bool holds(const features::FeatureVector& fv) const noexcept;
};

/**
 * @brief Conjunction of conditions forcing an outcome when it holds
 */
struct OverrideRule
{
    std::string name;
    std::vector<Condition> conditions;
    Verdict outcome = Verdict::kFail;

    [[nodiscard]] bool matches(const features::FeatureVector& fv) const noexcept;

    /// e.g. "critical_changes >= 3 AND type_changes >= 1 => FAIL"
    [[nodiscard]] std::string describe() const;
};

class PolicyConfig
{
public:
    static constexpr std::size_t kDefaultTopN = 5;

    [[nodiscard]] static qoeguard::Result<PolicyConfig>
    create(std::string name,
           double warn_threshold,
           double fail_threshold,
           std::vector<OverrideRule> overrides,
           std::size_t top_n = kDefaultTopN);

    /// warn 0.45, fail 0.72, critical_changes >= 3 AND type_changes >= 1 => FAIL
    [[nodiscard]] static PolicyConfig defaults();
    /// warn 0.35, fail 0.60, default override plus removed critical paths => FAIL
    [[nodiscard]] static PolicyConfig strict();
    /// warn 0.60, fail 0.85, no overrides
    [[nodiscard]] static PolicyConfig permissive();

    [[nodiscard]] static std::optional<PolicyConfig> preset(std::string_view name);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] double warn_threshold() const noexcept { return m_warn_threshold; }
    [[nodiscard]] double fail_threshold() const noexcept { return m_fail_threshold; }
    [[nodiscard]] const std::vector<OverrideRule>& overrides() const noexcept { return m_overrides; }
    [[nodiscard]] std::size_t top_n() const noexcept { return m_top_n; }

private:
    PolicyConfig(std::string name,
                 double warn_threshold,
                 double fail_threshold,
                 std::vector<OverrideRule> overrides,
                 std::size_t top_n)
        : m_name(std::move(name))
        , m_warn_threshold(warn_threshold)
        , m_fail_threshold(fail_threshold)
        , m_overrides(std::move(overrides))
        , m_top_n(top_n)
    {}

    std::string m_name;
    double m_warn_threshold = 0.0;
    double m_fail_threshold = 0.0;
    std::vector<OverrideRule> m_overrides;
    std::size_t m_top_n = kDefaultTopN;
};

// ============================================================================
// Scoring model selection
// ============================================================================

/**
 * @brief Node of a fixed decision tree; leaves have no children
 *
 * `value` is the risk estimate at the node. Internal nodes route to `left`
 * when feature <= threshold, otherwise to `right`.
 */
struct TreeNode
{
    std::optional<features::Feature> feature;
    double threshold = 0.0;
    std::optional<std::size_t> left;
    std::optional<std::size_t> right;
    double value = 0.0;

    [[nodiscard]] bool is_leaf() const noexcept { return !feature.has_value(); }
};

class DecisionTreeConfig
{
public:
    /**
     * Validates: non-empty, node 0 is the root, internal nodes have both
     * children, children come after their parent, all values in [0,1].
     */
    [[nodiscard]] static qoeguard::Result<DecisionTreeConfig> create(std::vector<TreeNode> nodes);

    [[nodiscard]] const std::vector<TreeNode>& nodes() const noexcept { return m_nodes; }

private:
    explicit DecisionTreeConfig(std::vector<TreeNode> nodes)
        : m_nodes(std::move(nodes))
    {}

    std::vector<TreeNode> m_nodes;
};

enum class ModelKind : std::uint8_t { kLinear, kDecisionTree };

struct ModelConfig
{
    ModelKind kind = ModelKind::kLinear;
    std::optional<DecisionTreeConfig> tree;
};

// ============================================================================
// Aggregate configuration document
// ============================================================================

struct Config
{
    CriticalityConfig criticality = CriticalityConfig::streaming_defaults();
    WeightConfig weights = WeightConfig::defaults();
    PolicyConfig policy = PolicyConfig::defaults();
    ModelConfig model;
    std::vector<PathPattern> ignore_paths;
};

/**
 * @brief Build a Config from a decoded `qoeguard.config.v1` document
 *
 * Absent sections keep their defaults. Performs semantic validation only;
 * use load_config_file() for schema validation as well.
 */
[[nodiscard]] qoeguard::Result<Config> parse_config(const nlohmann::json& document);

/**
 * @brief Read, schema-validate and parse a configuration file
 * @param path Configuration JSON file
 * @param schema_dir Directory containing config.v1.schema.json
 */
[[nodiscard]] qoeguard::Result<Config> load_config_file(const std::filesystem::path& path,
                                                        const std::filesystem::path& schema_dir);

}  // namespace qoeguard::config
