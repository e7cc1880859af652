/**
 * @file config.cpp
 * @brief Configuration factories, presets and document parsing
 */

#include "qoeguard/config.hpp"

#include "qoeguard/schema_validate.hpp"
#include "qoeguard/version.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <fstream>
#include <ranges>
#include <unordered_set>
#include <utility>

namespace qoeguard::config {

namespace {

using features::Feature;

[[nodiscard]] std::unexpected<qoeguard::Error> invalid(std::string message)
{
    return std::unexpected(qoeguard::Error::make("InvalidConfig", std::move(message)));
}

[[nodiscard]] bool is_unit_interval(double value) noexcept
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

[[nodiscard]] OverrideRule critical_type_override()
{
    return OverrideRule{
        .name = "critical_type_change",
        .conditions = {Condition{.feature = Feature::kCriticalChanges,
                                 .op = Comparison::kGreaterEqual,
                                 .threshold = 3.0},
                       Condition{.feature = Feature::kTypeChanges,
                                 .op = Comparison::kGreaterEqual,
                                 .threshold = 1.0}},
        .outcome = Verdict::kFail,
    };
}

[[nodiscard]] OverrideRule removed_critical_override()
{
    return OverrideRule{
        .name = "removed_critical_path",
        .conditions = {Condition{.feature = Feature::kRemovedFields,
                                 .op = Comparison::kGreaterEqual,
                                 .threshold = 1.0},
                       Condition{.feature = Feature::kCriticalChanges,
                                 .op = Comparison::kGreaterEqual,
                                 .threshold = 1.0}},
        .outcome = Verdict::kFail,
    };
}

// ----------------------------------------------------------------------------
// Document readers
// ----------------------------------------------------------------------------

[[nodiscard]] qoeguard::Result<std::optional<double>>
read_number(const nlohmann::json& object, std::string_view key, std::string_view context)
{
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<double>{};
    }
    if (!it->is_number()) {
        return invalid(std::format("{}.{} must be a number", context, key));
    }
    return std::optional<double>{it->get<double>()};
}

[[nodiscard]] qoeguard::Result<std::optional<std::string>>
read_string(const nlohmann::json& object, std::string_view key, std::string_view context)
{
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return invalid(std::format("{}.{} must be a string", context, key));
    }
    return std::optional<std::string>{it->get<std::string>()};
}

[[nodiscard]] qoeguard::Result<Feature> read_feature(const nlohmann::json& object,
                                                     std::string_view context)
{
    auto name = read_string(object, "feature", context);
    if (!name) {
        return std::unexpected(name.error());
    }
    if (!*name) {
        return invalid(std::format("{}.feature is required", context));
    }
    auto feature = features::feature_from_name(**name);
    if (!feature) {
        return invalid(std::format("{}.feature: unknown feature '{}'", context, **name));
    }
    return *feature;
}

[[nodiscard]] qoeguard::Result<CriticalityConfig> parse_criticality(const nlohmann::json& section)
{
    if (!section.is_array()) {
        return invalid("criticality must be an array");
    }
    std::vector<CriticalityConfig::Entry> entries;
    entries.reserve(section.size());
    for (std::size_t i = 0; i < section.size(); ++i) {
        const auto& item = section[i];
        const std::string context = std::format("criticality[{}]", i);
        if (!item.is_object()) {
            return invalid(context + " must be an object");
        }
        auto pattern = read_string(item, "pattern", context);
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        auto weight = read_number(item, "weight", context);
        if (!weight) {
            return std::unexpected(weight.error());
        }
        if (!*pattern || !*weight) {
            return invalid(context + " requires pattern and weight");
        }
        entries.push_back(CriticalityConfig::Entry{.pattern = **pattern, .weight = **weight});
    }
    return CriticalityConfig::create(std::move(entries));
}

[[nodiscard]] qoeguard::VoidResult apply_feature_weight(const nlohmann::json& item,
                                                        std::string_view context,
                                                        FeatureWeight& entry)
{
    if (!item.is_object()) {
        return invalid(std::string(context) + " must be an object");
    }
    auto weight = read_number(item, "weight", context);
    if (!weight) {
        return std::unexpected(weight.error());
    }
    auto scale = read_number(item, "scale", context);
    if (!scale) {
        return std::unexpected(scale.error());
    }
    if (*weight) {
        entry.weight = **weight;
    }
    if (*scale) {
        entry.scale = **scale;
    }
    if (item.contains("cap")) {
        auto cap = read_number(item, "cap", context);
        if (!cap) {
            return std::unexpected(cap.error());
        }
        entry.cap = *cap;  // explicit null removes the cap
    }
    return {};
}

[[nodiscard]] qoeguard::Result<WeightConfig> parse_weights(const nlohmann::json& section)
{
    if (!section.is_object()) {
        return invalid("weights must be an object");
    }
    const WeightConfig defaults = WeightConfig::defaults();
    WeightConfig::Table table = defaults.table();

    auto bias = read_number(section, "bias", "weights");
    if (!bias) {
        return std::unexpected(bias.error());
    }
    bool allow_negative = false;
    if (const auto it = section.find("allow_negative"); it != section.end()) {
        if (!it->is_boolean()) {
            return invalid("weights.allow_negative must be a boolean");
        }
        allow_negative = it->get<bool>();
    }
    if (const auto it = section.find("features"); it != section.end()) {
        if (!it->is_object()) {
            return invalid("weights.features must be an object");
        }
        for (const auto& [name, item] : it->items()) {
            auto feature = features::feature_from_name(name);
            if (!feature) {
                return invalid(std::format("weights.features: unknown feature '{}'", name));
            }
            const std::string context = "weights.features." + name;
            if (auto applied =
                    apply_feature_weight(item, context, table[features::feature_index(*feature)]);
                !applied) {
                return std::unexpected(applied.error());
            }
        }
    }
    return WeightConfig::create(table, bias->value_or(defaults.bias()), allow_negative);
}

[[nodiscard]] qoeguard::Result<Condition> parse_condition(const nlohmann::json& item,
                                                          std::string_view context)
{
    if (!item.is_object()) {
        return invalid(std::string(context) + " must be an object");
    }
    auto feature = read_feature(item, context);
    if (!feature) {
        return std::unexpected(feature.error());
    }
    auto symbol = read_string(item, "op", context);
    if (!symbol) {
        return std::unexpected(symbol.error());
    }
    auto op = comparison_from_symbol(symbol->value_or(">="));
    if (!op) {
        return invalid(std::format("{}.op: unknown comparison '{}'", context, **symbol));
    }
    auto threshold = read_number(item, "value", context);
    if (!threshold) {
        return std::unexpected(threshold.error());
    }
    if (!*threshold) {
        return invalid(std::format("{}.value is required", context));
    }
    return Condition{.feature = *feature, .op = *op, .threshold = **threshold};
}

[[nodiscard]] qoeguard::Result<OverrideRule> parse_override(const nlohmann::json& item,
                                                            std::string_view context)
{
    if (!item.is_object()) {
        return invalid(std::string(context) + " must be an object");
    }
    auto name = read_string(item, "name", context);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto outcome_name = read_string(item, "outcome", context);
    if (!outcome_name) {
        return std::unexpected(outcome_name.error());
    }
    auto outcome = verdict_from_name(outcome_name->value_or("FAIL"));
    if (!outcome) {
        return invalid(std::format("{}.outcome: unknown verdict '{}'", context, **outcome_name));
    }
    const auto when = item.find("when");
    if (when == item.end() || !when->is_array()) {
        return invalid(std::format("{}.when must be an array of conditions", context));
    }
    OverrideRule rule{.name = name->value_or(""), .conditions = {}, .outcome = *outcome};
    for (std::size_t i = 0; i < when->size(); ++i) {
        auto condition = parse_condition((*when)[i], std::format("{}.when[{}]", context, i));
        if (!condition) {
            return std::unexpected(condition.error());
        }
        rule.conditions.push_back(*condition);
    }
    return rule;
}

[[nodiscard]] qoeguard::Result<PolicyConfig> parse_policy(const nlohmann::json& section)
{
    if (!section.is_object()) {
        return invalid("policy must be an object");
    }
    auto preset_name = read_string(section, "preset", "policy");
    if (!preset_name) {
        return std::unexpected(preset_name.error());
    }
    auto base = PolicyConfig::preset(preset_name->value_or("default"));
    if (!base) {
        return invalid(std::format("policy.preset: unknown preset '{}'", **preset_name));
    }

    auto name = read_string(section, "name", "policy");
    if (!name) {
        return std::unexpected(name.error());
    }
    auto warn = read_number(section, "warn_threshold", "policy");
    if (!warn) {
        return std::unexpected(warn.error());
    }
    auto fail = read_number(section, "fail_threshold", "policy");
    if (!fail) {
        return std::unexpected(fail.error());
    }

    std::size_t top_n = base->top_n();
    if (const auto it = section.find("top_n"); it != section.end()) {
        if (!it->is_number_unsigned()) {
            return invalid("policy.top_n must be a non-negative integer");
        }
        top_n = it->get<std::size_t>();
    }

    std::vector<OverrideRule> overrides = base->overrides();
    if (const auto it = section.find("overrides"); it != section.end()) {
        if (!it->is_array()) {
            return invalid("policy.overrides must be an array");
        }
        overrides.clear();
        for (std::size_t i = 0; i < it->size(); ++i) {
            auto rule = parse_override((*it)[i], std::format("policy.overrides[{}]", i));
            if (!rule) {
                return std::unexpected(rule.error());
            }
            overrides.push_back(std::move(*rule));
        }
    }

    return PolicyConfig::create(name->value_or(base->name()),
                                warn->value_or(base->warn_threshold()),
                                fail->value_or(base->fail_threshold()),
                                std::move(overrides),
                                top_n);
}

[[nodiscard]] qoeguard::Result<TreeNode> parse_tree_node(const nlohmann::json& item,
                                                         std::string_view context)
{
    if (!item.is_object()) {
        return invalid(std::string(context) + " must be an object");
    }
    TreeNode node;
    auto value = read_number(item, "value", context);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (!*value) {
        return invalid(std::format("{}.value is required", context));
    }
    node.value = **value;
    // Children are read for leaves too; DecisionTreeConfig::create rejects them there.
    for (const auto* key : {"left", "right"}) {
        const auto it = item.find(key);
        if (it == item.end()) {
            continue;
        }
        if (!it->is_number_unsigned()) {
            return invalid(std::format("{}.{} must be a node index", context, key));
        }
        (std::string_view(key) == "left" ? node.left : node.right) = it->get<std::size_t>();
    }
    if (!item.contains("feature")) {
        return node;
    }
    auto feature = read_feature(item, context);
    if (!feature) {
        return std::unexpected(feature.error());
    }
    node.feature = *feature;
    auto threshold = read_number(item, "threshold", context);
    if (!threshold) {
        return std::unexpected(threshold.error());
    }
    node.threshold = threshold->value_or(0.0);
    return node;
}

[[nodiscard]] qoeguard::Result<ModelConfig> parse_model(const nlohmann::json& section)
{
    if (!section.is_object()) {
        return invalid("model must be an object");
    }
    auto kind = read_string(section, "kind", "model");
    if (!kind) {
        return std::unexpected(kind.error());
    }
    const std::string kind_name = kind->value_or("linear");
    if (kind_name == "linear") {
        return ModelConfig{.kind = ModelKind::kLinear, .tree = std::nullopt};
    }
    if (kind_name != "decision_tree") {
        return invalid(std::format("model.kind: unknown model '{}'", kind_name));
    }
    const auto nodes_json = section.find("nodes");
    if (nodes_json == section.end() || !nodes_json->is_array()) {
        return invalid("model.nodes must be an array for decision_tree");
    }
    std::vector<TreeNode> nodes;
    nodes.reserve(nodes_json->size());
    for (std::size_t i = 0; i < nodes_json->size(); ++i) {
        auto node = parse_tree_node((*nodes_json)[i], std::format("model.nodes[{}]", i));
        if (!node) {
            return std::unexpected(node.error());
        }
        nodes.push_back(*node);
    }
    auto tree = DecisionTreeConfig::create(std::move(nodes));
    if (!tree) {
        return std::unexpected(tree.error());
    }
    return ModelConfig{.kind = ModelKind::kDecisionTree, .tree = std::move(*tree)};
}

[[nodiscard]] qoeguard::Result<std::vector<PathPattern>> parse_ignore_paths(const nlohmann::json& section)
{
    if (!section.is_array()) {
        return invalid("ignore_paths must be an array");
    }
    std::vector<PathPattern> patterns;
    patterns.reserve(section.size());
    for (std::size_t i = 0; i < section.size(); ++i) {
        const auto& item = section[i];
        if (!item.is_string()) {
            return invalid(std::format("ignore_paths[{}] must be a string", i));
        }
        auto pattern = PathPattern::parse(item.get<std::string>());
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        patterns.push_back(std::move(*pattern));
    }
    return patterns;
}

}  // namespace

// ============================================================================
// CriticalityConfig
// ============================================================================

qoeguard::Result<CriticalityConfig> CriticalityConfig::create(std::vector<Entry> entries)
{
    std::vector<CriticalityRule> rules;
    rules.reserve(entries.size());
    std::unordered_set<std::string> seen;
    for (auto& entry : entries) {
        if (!is_unit_interval(entry.weight)) {
            return invalid(std::format("criticality weight for '{}' must be in [0,1], got {}",
                                       entry.pattern,
                                       entry.weight));
        }
        auto pattern = PathPattern::parse(entry.pattern);
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        if (!seen.insert(entry.pattern).second) {
            return invalid(std::format("duplicate criticality pattern '{}'", entry.pattern));
        }
        rules.push_back(CriticalityRule{.pattern = std::move(*pattern), .weight = entry.weight});
    }
    return CriticalityConfig(std::move(rules));
}

CriticalityConfig CriticalityConfig::streaming_defaults()
{
    auto config = create({
        {  "$.playback", 1.00},
        {       "$.drm", 0.95},
        {"$.entitlement", 0.95},
        {  "$.manifest", 0.95},
        {   "$.license", 0.90},
        {       "$.ads", 0.85},
        {      "$.auth", 0.80},
    });
    return config ? std::move(*config) : CriticalityConfig{};
}

const CriticalityRule* CriticalityConfig::match(const Path& path) const noexcept
{
    for (const auto& rule : m_rules) {
        if (rule.pattern.matches_prefix_of(path)) {
            return &rule;
        }
    }
    return nullptr;
}

// ============================================================================
// WeightConfig
// ============================================================================

qoeguard::Result<WeightConfig> WeightConfig::create(Table weights, double bias, bool allow_negative)
{
    if (!std::isfinite(bias)) {
        return invalid("bias must be finite");
    }
    for (Feature feature : features::kAllFeatures) {
        const FeatureWeight& entry = weights[features::feature_index(feature)];
        const std::string_view name = features::feature_name(feature);
        if (!std::isfinite(entry.weight)) {
            return invalid(std::format("weight for {} must be finite", name));
        }
        if (!allow_negative && entry.weight < 0.0) {
            return invalid(std::format("weight for {} is negative ({}) and allow_negative is off",
                                       name,
                                       entry.weight));
        }
        if (!std::isfinite(entry.scale) || entry.scale <= 0.0) {
            return invalid(std::format("scale for {} must be a positive number", name));
        }
        if (entry.cap && (!std::isfinite(*entry.cap) || *entry.cap < 0.0)) {
            return invalid(std::format("cap for {} must be a non-negative number", name));
        }
    }
    return WeightConfig(weights, bias, allow_negative);
}

WeightConfig WeightConfig::defaults()
{
    Table table{};
    table[features::feature_index(Feature::kCriticalChanges)] = {.weight = 0.18, .scale = 1.0, .cap = {}};
    table[features::feature_index(Feature::kTypeChanges)] = {.weight = 0.14, .scale = 1.0, .cap = {}};
    table[features::feature_index(Feature::kRemovedFields)] = {.weight = 0.10, .scale = 1.0, .cap = {}};
    table[features::feature_index(Feature::kAddedFields)] = {.weight = 0.05, .scale = 1.0, .cap = {}};
    table[features::feature_index(Feature::kArrayLenChanges)] = {.weight = 0.07, .scale = 1.0, .cap = {}};
    table[features::feature_index(Feature::kNumericDeltaMax)] = {.weight = 0.16, .scale = 5.0, .cap = 10.0};
    table[features::feature_index(Feature::kNumericDeltaSum)] = {.weight = 0.06, .scale = 10.0, .cap = 10.0};
    table[features::feature_index(Feature::kValueChanges)] = {.weight = 0.04, .scale = 10.0, .cap = 10.0};
    return WeightConfig(table, -1.2, false);
}

double WeightConfig::normalize(Feature feature, double raw) const noexcept
{
    const FeatureWeight& entry = weight(feature);
    double scaled = common::saturate(raw / entry.scale);
    if (entry.cap) {
        scaled = std::min(scaled, *entry.cap);
    }
    return scaled;
}

// ============================================================================
// Policy
// ============================================================================

std::string_view verdict_name(Verdict verdict) noexcept
{
    switch (verdict) {
        case Verdict::kPass:
            return "PASS";
        case Verdict::kWarn:
            return "WARN";
        case Verdict::kFail:
            return "FAIL";
    }
    return "FAIL";
}

std::optional<Verdict> verdict_from_name(std::string_view name) noexcept
{
    for (Verdict verdict : {Verdict::kPass, Verdict::kWarn, Verdict::kFail}) {
        if (verdict_name(verdict) == name) {
            return verdict;
        }
    }
    return std::nullopt;
}

std::string_view comparison_symbol(Comparison op) noexcept
{
    switch (op) {
        case Comparison::kGreaterEqual:
            return ">=";
        case Comparison::kGreater:
            return ">";
        case Comparison::kLessEqual:
            return "<=";
        case Comparison::kLess:
            return "<";
        case Comparison::kEqual:
            return "==";
    }
    return ">=";
}

std::optional<Comparison> comparison_from_symbol(std::string_view symbol) noexcept
{
    for (Comparison op : {Comparison::kGreaterEqual,
                          Comparison::kGreater,
                          Comparison::kLessEqual,
                          Comparison::kLess,
                          Comparison::kEqual}) {
        if (comparison_symbol(op) == symbol) {
            return op;
        }
    }
    return std::nullopt;
}

bool Condition::holds(const features::FeatureVector& fv) const noexcept
{
    const double actual = fv.value(feature);
    switch (op) {
        case Comparison::kGreaterEqual:
            return actual >= threshold;
        case Comparison::kGreater:
            return actual > threshold;
        case Comparison::kLessEqual:
            return actual <= threshold;
        case Comparison::kLess:
            return actual < threshold;
        case Comparison::kEqual:
            return actual == threshold;
    }
    return false;
}

bool OverrideRule::matches(const features::FeatureVector& fv) const noexcept
{
    return std::ranges::all_of(conditions,
                               [&fv](const Condition& c) { return c.holds(fv); });
}

std::string OverrideRule::describe() const
{
    std::string text;
    for (auto [i, condition] : std::views::enumerate(conditions)) {
        if (i != 0) {
            text += " AND ";
        }
        text += std::format("{} {} {}",
                            features::feature_name(condition.feature),
                            comparison_symbol(condition.op),
                            condition.threshold);
    }
    return std::format("{} => {}", text, verdict_name(outcome));
}

qoeguard::Result<PolicyConfig> PolicyConfig::create(std::string name,
                                                    double warn_threshold,
                                                    double fail_threshold,
                                                    std::vector<OverrideRule> overrides,
                                                    std::size_t top_n)
{
    if (!is_unit_interval(warn_threshold)) {
        return invalid(std::format("warn_threshold must be in [0,1], got {}", warn_threshold));
    }
    if (!is_unit_interval(fail_threshold)) {
        return invalid(std::format("fail_threshold must be in [0,1], got {}", fail_threshold));
    }
    if (warn_threshold >= fail_threshold) {
        return invalid(std::format("warn_threshold ({}) must be below fail_threshold ({})",
                                   warn_threshold,
                                   fail_threshold));
    }
    if (top_n == 0) {
        return invalid("top_n must be at least 1");
    }
    std::unordered_set<std::string> names;
    for (auto [i, rule] : std::views::enumerate(overrides)) {
        if (rule.name.empty()) {
            rule.name = std::format("override_{}", i);
        }
        if (!names.insert(rule.name).second) {
            return invalid(std::format("duplicate override rule name '{}'", rule.name));
        }
        if (rule.conditions.empty()) {
            return invalid(std::format("override rule '{}' has no conditions", rule.name));
        }
        for (const auto& condition : rule.conditions) {
            if (!std::isfinite(condition.threshold)) {
                return invalid(std::format("override rule '{}' has a non-finite threshold",
                                           rule.name));
            }
        }
    }
    return PolicyConfig(std::move(name), warn_threshold, fail_threshold, std::move(overrides), top_n);
}

PolicyConfig PolicyConfig::defaults()
{
    return PolicyConfig("default", 0.45, 0.72, {critical_type_override()}, kDefaultTopN);
}

PolicyConfig PolicyConfig::strict()
{
    return PolicyConfig("strict",
                        0.35,
                        0.60,
                        {critical_type_override(), removed_critical_override()},
                        kDefaultTopN);
}

PolicyConfig PolicyConfig::permissive()
{
    return PolicyConfig("permissive", 0.60, 0.85, {}, kDefaultTopN);
}

std::optional<PolicyConfig> PolicyConfig::preset(std::string_view name)
{
    if (name == "default") {
        return defaults();
    }
    if (name == "strict") {
        return strict();
    }
    if (name == "permissive") {
        return permissive();
    }
    return std::nullopt;
}

// ============================================================================
// DecisionTreeConfig
// ============================================================================

qoeguard::Result<DecisionTreeConfig> DecisionTreeConfig::create(std::vector<TreeNode> nodes)
{
    if (nodes.empty()) {
        return invalid("decision tree has no nodes");
    }
    for (auto [i, node] : std::views::enumerate(nodes)) {
        const auto index = static_cast<std::size_t>(i);
        if (!is_unit_interval(node.value)) {
            return invalid(std::format("tree node {} value must be in [0,1]", index));
        }
        if (node.is_leaf()) {
            if (node.left || node.right) {
                return invalid(std::format("tree node {} has children but no feature", index));
            }
            continue;
        }
        if (!std::isfinite(node.threshold)) {
            return invalid(std::format("tree node {} threshold must be finite", index));
        }
        if (!node.left || !node.right) {
            return invalid(std::format("tree node {} needs both children", index));
        }
        // Children after parents keeps the tree acyclic and every walk finite.
        for (std::size_t child : {*node.left, *node.right}) {
            if (child <= index || child >= nodes.size()) {
                return invalid(std::format("tree node {} has invalid child index {}", index, child));
            }
        }
    }
    return DecisionTreeConfig(std::move(nodes));
}

// ============================================================================
// Documents
// ============================================================================

qoeguard::Result<Config> parse_config(const nlohmann::json& document)
{
    if (!document.is_object()) {
        return invalid("configuration document must be an object");
    }
    if (auto version = read_string(document, "schema_version", "config"); !version) {
        return std::unexpected(version.error());
    } else if (*version && **version != kConfigSchemaVersion) {
        return invalid(std::format("unsupported schema_version '{}' (expected {})",
                                   **version,
                                   kConfigSchemaVersion));
    }

    Config config;
    if (const auto it = document.find("criticality"); it != document.end()) {
        auto criticality = parse_criticality(*it);
        if (!criticality) {
            return std::unexpected(criticality.error());
        }
        config.criticality = std::move(*criticality);
    }
    if (const auto it = document.find("weights"); it != document.end()) {
        auto weights = parse_weights(*it);
        if (!weights) {
            return std::unexpected(weights.error());
        }
        config.weights = *weights;
    }
    if (const auto it = document.find("policy"); it != document.end()) {
        auto policy = parse_policy(*it);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        config.policy = std::move(*policy);
    }
    if (const auto it = document.find("model"); it != document.end()) {
        auto model = parse_model(*it);
        if (!model) {
            return std::unexpected(model.error());
        }
        config.model = std::move(*model);
    }
    if (const auto it = document.find("ignore_paths"); it != document.end()) {
        auto ignore = parse_ignore_paths(*it);
        if (!ignore) {
            return std::unexpected(ignore.error());
        }
        config.ignore_paths = std::move(*ignore);
    }
    return config;
}

qoeguard::Result<Config> load_config_file(const std::filesystem::path& path,
                                          const std::filesystem::path& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            qoeguard::Error::make("IOError", "Failed to open config file: " + path.string()));
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const std::exception& ex) {
        return std::unexpected(qoeguard::Error::make(
            "ParseError", "Failed to parse config file: " + path.string() + ": " + ex.what()));
    }

    const auto schema_path = schema_dir / "config.v1.schema.json";
    if (auto validation = common::validate_json(document, schema_path.string()); !validation) {
        return std::unexpected(validation.error());
    }
    return parse_config(document);
}

}  // namespace qoeguard::config
