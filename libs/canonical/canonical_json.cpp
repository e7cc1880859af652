/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "qoeguard/canonical_json.hpp"

#include <cmath>
#include <exception>
#include <format>

namespace qoeguard::canonical {

namespace {

qoeguard::VoidResult validate_finite(const nlohmann::json& j, const std::string& path)
{
    if (j.is_number_float() && !std::isfinite(j.get<double>())) {
        return std::unexpected(Error::make(
            "NonFiniteNumber",
            std::format("Non-finite number not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_finite(val, path + "." + key); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (std::size_t i = 0; i < j.size(); ++i) {
            if (auto result = validate_finite(j[i], std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

}  // namespace

qoeguard::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_finite(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    // nlohmann::json stores object members in a std::map, so keys are already sorted.
    try {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(Error::make("InvalidUtf8", ex.what()));
    }
}

qoeguard::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_finite(j, "$");
}

}  // namespace qoeguard::canonical
