#include "qoeguard/schema_validate.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace qoeguard::common::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(QOEGUARD_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_tool_json()
{
    return nlohmann::json{
        {   "name", "qoeguard"},
        {"version",    "0.1.0"}
    };
}

nlohmann::json make_features_json()
{
    return nlohmann::json{
        {     "added_fields",   0},
        {   "removed_fields",   0},
        {     "type_changes",   1},
        {    "value_changes",   0},
        {"numeric_delta_sum", 0.0},
        {"numeric_delta_max", 0.0},
        {"array_len_changes",   0},
        { "critical_changes",   1}
    };
}

nlohmann::json make_config_json()
{
    return nlohmann::json{
        {"schema_version", "qoeguard.config.v1"},
        {   "criticality",
         nlohmann::json::array({{{"pattern", "$.playback"}, {"weight", 1.0}},
         {{"pattern", "$.ads[*].tracking"}, {"weight", 0.0}}})},
        {       "weights",
         {{"bias", -1.2},
         {"features",
         {{"critical_changes", {{"weight", 0.18}}},
         {"numeric_delta_max", {{"weight", 0.16}, {"scale", 5.0}, {"cap", nullptr}}}}}}},
        {        "policy",
         {{"preset", "strict"},
         {"top_n", 3},
         {"overrides",
         nlohmann::json::array({{{"name", "many_types"},
         {"when", nlohmann::json::array({{{"feature", "type_changes"}, {"op", ">"}, {"value", 4}}})},
         {"outcome", "WARN"}}})}}},
        {         "model",
         {{"kind", "decision_tree"},
         {"nodes",
         nlohmann::json::array({{{"feature", "critical_changes"},
         {"threshold", 0},
         {"left", 1},
         {"right", 2},
         {"value", 0.3}},
         {{"value", 0.1}},
         {{"value", 0.9}}})}}},
        {  "ignore_paths",                                     nlohmann::json::array({"$.metadata.etag"})}
    };
}

nlohmann::json make_report_json()
{
    nlohmann::json contributions = nlohmann::json::object();
    for (const auto& [name, value] : make_features_json().items()) {
        contributions[name] = 0.0;
    }
    contributions["type_changes"] = 0.14;
    contributions["critical_changes"] = 0.18;

    return nlohmann::json{
        {      "schema_version",                                                "qoeguard.report.v1"},
        {                "tool",                                                    make_tool_json()},
        {             "verdict",                                                              "PASS"},
        {          "risk_score",                                                              0.2931},
        {               "model",                       {{"name", "linear"}, {"baseline", -1.2}, {"z", -0.88}}},
        {       "override_rule",                                                             nullptr},
        {            "features",                                                make_features_json()},
        {       "contributions",                                                       contributions},
        {         "top_signals",
         nlohmann::json::array({{{"type", "feature"},
         {"feature", "critical_changes"},
         {"value", 1},
         {"contribution", 0.18}},
         {{"type", "change"},
         {"path", "$.a.bitrate"},
         {"kind", "type_changed"},
         {"criticality", 1.0},
         {"pattern", "$.a"},
         {"contribution", 0.18}}})                                                                    },
        {        "change_count",                                                                   1},
        {"ignored_change_count",                                                                   0},
        {             "changes",
         nlohmann::json::array(
         {{{"path", "$.a.bitrate"}, {"kind", "type_changed"}, {"old", 8000}, {"new", "8000"}}})      },
        {              "policy",
         {{"name", "default"},
         {"warn_threshold", 0.45},
         {"fail_threshold", 0.72},
         {"top_n", 5},
         {"overrides",
         nlohmann::json::array(
         {{{"name", "critical_type_change"},
         {"rule", "critical_changes >= 3 AND type_changes >= 1 => FAIL"}}})}}             }
    };
}

struct SchemaCase
{
    std::string schema_file;
    nlohmann::json valid_json;
};

std::vector<SchemaCase> make_schema_cases()
{
    return {
        {.schema_file = "config.v1.schema.json", .valid_json = make_config_json()},
        {.schema_file = "report.v1.schema.json", .valid_json = make_report_json()}
    };
}

}  // namespace

TEST(SchemaValidateTest, ValidSchemaSamplesPass)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        auto result = qoeguard::common::validate_json(schema_case.valid_json,
                                                      schema_path(schema_case.schema_file));

        EXPECT_TRUE(result) << (result ? "" : result.error().message);
    }
}

TEST(SchemaValidateTest, InvalidSchemaSamplesFail)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        nlohmann::json invalid = schema_case.valid_json;
        invalid["schema_version"] = "invalid.v0";

        auto result = qoeguard::common::validate_json(invalid, schema_path(schema_case.schema_file));

        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, "SchemaValidationFailed");
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, CrossFileReferencesAreEnforced)
{
    auto config = make_config_json();
    config["criticality"][0]["weight"] = 1.5;
    auto bad_weight = validate_json(config, schema_path("config.v1.schema.json"));
    ASSERT_FALSE(bad_weight);
    EXPECT_NE(bad_weight.error().message.find("criticality"), std::string::npos);

    auto report = make_report_json();
    report["verdict"] = "MAYBE";
    EXPECT_FALSE(validate_json(report, schema_path("report.v1.schema.json")));
}

TEST(SchemaValidateTest, UnknownFeatureNameRejected)
{
    auto config = make_config_json();
    config["weights"]["features"]["latency"] = {{"weight", 1.0}};
    EXPECT_FALSE(validate_json(config, schema_path("config.v1.schema.json")));

    config = make_config_json();
    config["policy"]["overrides"][0]["when"][0]["feature"] = "latency";
    EXPECT_FALSE(validate_json(config, schema_path("config.v1.schema.json")));
}

TEST(SchemaValidateTest, UnexpectedTopLevelKeyRejected)
{
    auto config = make_config_json();
    config["thresholds"] = {{"warn", 0.5}};
    EXPECT_FALSE(validate_json(config, schema_path("config.v1.schema.json")));
}

TEST(SchemaValidateTest, MissingSchemaFileReported)
{
    auto result = validate_json(make_config_json(), schema_path("missing.v1.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace qoeguard::common::test
