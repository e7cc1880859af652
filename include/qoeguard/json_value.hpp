#pragma once

/**
 * @file json_value.hpp
 * @brief Immutable tagged-union model of decoded JSON
 *
 * JsonValue is the input type of the diff engine. Arrays and objects share
 * their (immutable) storage between copies, so passing values around is cheap
 * and copies of a value compare equal by identity before content.
 */

#include "qoeguard/common.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace qoeguard {

/**
 * JSON variant tags. The diff engine compares these tags, not the content,
 * to tell a type change from a value change.
 */
enum class JsonKind : std::uint8_t {
    kNull,
    kBool,
    kNumber,
    kString,
    kArray,
    kObject
};

/**
 * @brief Lower-case JSON type name ("null", "bool", "number", ...)
 */
[[nodiscard]] std::string_view json_kind_name(JsonKind kind) noexcept;

class JsonValue
{
public:
    using Array = std::vector<JsonValue>;
    using Member = std::pair<std::string, JsonValue>;
    using Object = std::vector<Member>;

    /// Null
    JsonValue() noexcept = default;

    JsonValue(const JsonValue&) = default;
    JsonValue(JsonValue&&) noexcept = default;
    JsonValue& operator=(const JsonValue&) = default;
    JsonValue& operator=(JsonValue&&) noexcept = default;

    /// Releases nested storage without recursing once per nesting level
    ~JsonValue();

    [[nodiscard]] static JsonValue null() noexcept { return JsonValue{}; }
    [[nodiscard]] static JsonValue boolean(bool value);
    [[nodiscard]] static JsonValue number(double value);
    [[nodiscard]] static JsonValue string(std::string value);
    [[nodiscard]] static JsonValue array(Array items);

    /**
     * Build an object. Member order is kept; a repeated key keeps the
     * position of its first occurrence and the value of its last.
     */
    [[nodiscard]] static JsonValue object(Object members);

    [[nodiscard]] JsonKind kind() const noexcept;

    [[nodiscard]] bool is_null() const noexcept { return kind() == JsonKind::kNull; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == JsonKind::kNumber; }
    [[nodiscard]] bool is_array() const noexcept { return kind() == JsonKind::kArray; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == JsonKind::kObject; }

    // Accessors require the matching kind.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Array& as_array() const;
    [[nodiscard]] const Object& as_object() const;

    /**
     * @brief Look up an object member
     * @return Pointer to the member value, or nullptr if absent or not an object
     */
    [[nodiscard]] const JsonValue* find(std::string_view key) const;

    /**
     * @brief Element count for arrays and objects, 0 otherwise
     */
    [[nodiscard]] std::size_t size() const noexcept;

    /**
     * @brief True when both values share the same array/object storage
     */
    [[nodiscard]] bool shares_storage_with(const JsonValue& other) const noexcept;

    friend bool operator==(const JsonValue& lhs, const JsonValue& rhs);

private:
    // Mutable only so the destructor can move children out of sole-owned storage.
    using ArrayPtr = std::shared_ptr<Array>;
    using ObjectPtr = std::shared_ptr<Object>;
    using Storage = std::variant<std::monostate, bool, double, std::string, ArrayPtr, ObjectPtr>;

    explicit JsonValue(Storage data) noexcept
        : m_data(std::move(data))
    {}

    /// Move the children of sole-owned array/object storage into `pending`
    void release_children(std::vector<JsonValue>& pending) noexcept;

    Storage m_data;
};

}  // namespace qoeguard

namespace qoeguard::json {

/**
 * Convert a decoded nlohmann document. Integer and floating representations
 * both become Number; insertion order of ordered_json objects is kept.
 */
[[nodiscard]] JsonValue from_nlohmann(const nlohmann::ordered_json& j);
[[nodiscard]] JsonValue from_nlohmann(const nlohmann::json& j);

/**
 * Convert back for reporting. Integral numbers within +/-2^53 are emitted as
 * integers so that 8000 renders as 8000, not 8000.0.
 */
[[nodiscard]] nlohmann::json to_nlohmann(const JsonValue& value);

/**
 * @brief Parse JSON text
 * @return Decoded value or ParseError
 */
[[nodiscard]] qoeguard::Result<JsonValue> parse(std::string_view text);

/**
 * @brief Read and parse a JSON file
 * @return Decoded value, IOError or ParseError
 */
[[nodiscard]] qoeguard::Result<JsonValue> read_file(const std::string& path);

}  // namespace qoeguard::json
