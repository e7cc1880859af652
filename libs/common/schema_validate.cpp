/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "qoeguard/schema_validate.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace qoeguard::common {

namespace {

constexpr std::string_view kSchemaRefPrefix = "qoeguard:schema/";
constexpr std::string_view kDraft2020DefsPrefix = "#/$defs/";

/// valijson understands draft-07 `definitions`; our schemas are written with `$defs`.
void rewrite_defs(nlohmann::json& node)
{
    if (node.is_array()) {
        for (auto& item : node) {
            rewrite_defs(item);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }
    if (const auto defs = node.find("$defs"); defs != node.end() && !node.contains("definitions")) {
        node["definitions"] = *defs;
    }
    for (auto& [key, value] : node.items()) {
        if (key == "$ref" && value.is_string()) {
            const auto ref = value.get<std::string>();
            if (ref.starts_with(kDraft2020DefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDraft2020DefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] std::optional<nlohmann::json> read_json(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    rewrite_defs(document);
    return document;
}

/**
 * @brief Owns every schema document fetched while resolving `$ref`s
 */
class SchemaStore
{
public:
    explicit SchemaStore(std::filesystem::path schema_dir)
        : m_schema_dir(std::move(schema_dir))
    {}

    [[nodiscard]] const nlohmann::json* fetch(const std::string& uri)
    {
        if (!uri.starts_with(kSchemaRefPrefix)) {
            return nullptr;
        }
        const auto name = uri.substr(kSchemaRefPrefix.size());
        auto document = read_json(m_schema_dir / (name + ".schema.json"));
        if (!document) {
            return nullptr;
        }
        m_documents.push_back(std::make_unique<nlohmann::json>(std::move(*document)));
        return m_documents.back().get();
    }

private:
    std::filesystem::path m_schema_dir;
    std::vector<std::unique_ptr<nlohmann::json>> m_documents;
};

[[nodiscard]] std::string describe_violations(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        // valijson context parts look like "<root>", "[criticality]", "[0]".
        std::string pointer;
        for (const auto& part : error.context) {
            if (part == "<root>") {
                continue;
            }
            std::string_view token = part;
            if (token.size() >= 2 && token.front() == '[' && token.back() == ']') {
                token = token.substr(1, token.size() - 2);
            }
            pointer += "/";
            pointer += token;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text;
}

}  // namespace

qoeguard::VoidResult validate_json(const nlohmann::json& document, const std::string& schema_path)
{
    if (!std::filesystem::exists(schema_path)) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + schema_path));
    }
    auto schema_json = read_json(schema_path);
    if (!schema_json) {
        return std::unexpected(
            Error::make("SchemaParseFailed", "Failed to parse schema JSON: " + schema_path));
    }

    SchemaStore store(std::filesystem::path(schema_path).parent_path());
    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(
            schema_adapter,
            schema,
            [&store](const std::string& uri) { return store.fetch(uri); },
            [](const nlohmann::json*) {});
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(document);
    if (validator.validate(schema, target, &results)) {
        return {};
    }
    auto violations = describe_violations(results);
    if (violations.empty()) {
        violations = "Schema validation failed.";
    }
    return std::unexpected(Error::make("SchemaValidationFailed", std::move(violations)));
}

}  // namespace qoeguard::common
