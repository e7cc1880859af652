#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation for configuration and report documents
 */

#include "qoeguard/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace qoeguard::common {

/**
 * Validate a document against a JSON Schema file.
 *
 * `$ref` values of the form `qoeguard:schema/<name>` resolve to
 * `<name>.schema.json` next to `schema_path`.
 *
 * @param document JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success; SchemaValidationFailed lists every violation as
 *         "<json-pointer>: <description>", one per line
 */
[[nodiscard]] qoeguard::VoidResult validate_json(const nlohmann::json& document,
                                                 const std::string& schema_path);

}  // namespace qoeguard::common
