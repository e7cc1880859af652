/**
 * @file json_value.cpp
 * @brief JsonValue construction, equality and nlohmann conversion
 */

#include "qoeguard/json_value.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace qoeguard {

namespace {

[[noreturn]] void throw_kind_mismatch(JsonKind expected, JsonKind actual)
{
    throw std::logic_error(std::string("JsonValue holds ") + std::string(json_kind_name(actual))
                           + ", not " + std::string(json_kind_name(expected)));
}

}  // namespace

std::string_view json_kind_name(JsonKind kind) noexcept
{
    switch (kind) {
        case JsonKind::kNull:
            return "null";
        case JsonKind::kBool:
            return "bool";
        case JsonKind::kNumber:
            return "number";
        case JsonKind::kString:
            return "string";
        case JsonKind::kArray:
            return "array";
        case JsonKind::kObject:
            return "object";
    }
    return "null";
}

JsonValue JsonValue::boolean(bool value)
{
    return JsonValue(Storage{std::in_place_type<bool>, value});
}

JsonValue JsonValue::number(double value)
{
    return JsonValue(Storage{std::in_place_type<double>, value});
}

JsonValue JsonValue::string(std::string value)
{
    return JsonValue(Storage{std::in_place_type<std::string>, std::move(value)});
}

JsonValue JsonValue::array(Array items)
{
    return JsonValue(
        Storage{std::in_place_type<ArrayPtr>, std::make_shared<Array>(std::move(items))});
}

JsonValue JsonValue::object(Object members)
{
    Object unique;
    unique.reserve(members.size());
    std::unordered_map<std::string, std::size_t> positions;
    for (auto& [key, value] : members) {
        if (auto it = positions.find(key); it != positions.end()) {
            unique[it->second].second = std::move(value);
            continue;
        }
        positions.emplace(key, unique.size());
        unique.emplace_back(std::move(key), std::move(value));
    }
    return JsonValue(
        Storage{std::in_place_type<ObjectPtr>, std::make_shared<Object>(std::move(unique))});
}

JsonValue::~JsonValue()
{
    std::vector<JsonValue> pending;
    release_children(pending);
    while (!pending.empty()) {
        JsonValue item = std::move(pending.back());
        pending.pop_back();
        item.release_children(pending);
    }
}

void JsonValue::release_children(std::vector<JsonValue>& pending) noexcept
{
    // A use count of 1 means no other JsonValue can reach this storage.
    if (auto* items = std::get_if<ArrayPtr>(&m_data); items != nullptr && *items
                                                      && items->use_count() == 1) {
        for (auto& item : **items) {
            if (item.size() > 0) {
                pending.push_back(std::move(item));
            }
        }
        items->reset();
    } else if (auto* members = std::get_if<ObjectPtr>(&m_data); members != nullptr && *members
                                                                && members->use_count() == 1) {
        for (auto& member : **members) {
            if (member.second.size() > 0) {
                pending.push_back(std::move(member.second));
            }
        }
        members->reset();
    }
}

JsonKind JsonValue::kind() const noexcept
{
    // Variant alternatives are declared in JsonKind order.
    return static_cast<JsonKind>(m_data.index());
}

bool JsonValue::as_bool() const
{
    if (const auto* value = std::get_if<bool>(&m_data)) {
        return *value;
    }
    throw_kind_mismatch(JsonKind::kBool, kind());
}

double JsonValue::as_number() const
{
    if (const auto* value = std::get_if<double>(&m_data)) {
        return *value;
    }
    throw_kind_mismatch(JsonKind::kNumber, kind());
}

const std::string& JsonValue::as_string() const
{
    if (const auto* value = std::get_if<std::string>(&m_data)) {
        return *value;
    }
    throw_kind_mismatch(JsonKind::kString, kind());
}

const JsonValue::Array& JsonValue::as_array() const
{
    if (const auto* value = std::get_if<ArrayPtr>(&m_data)) {
        return **value;
    }
    throw_kind_mismatch(JsonKind::kArray, kind());
}

const JsonValue::Object& JsonValue::as_object() const
{
    if (const auto* value = std::get_if<ObjectPtr>(&m_data)) {
        return **value;
    }
    throw_kind_mismatch(JsonKind::kObject, kind());
}

const JsonValue* JsonValue::find(std::string_view key) const
{
    const auto* members = std::get_if<ObjectPtr>(&m_data);
    if (members == nullptr) {
        return nullptr;
    }
    for (const auto& [name, value] : **members) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

std::size_t JsonValue::size() const noexcept
{
    // Storage is null only in a moved-from value.
    if (const auto* items = std::get_if<ArrayPtr>(&m_data)) {
        return *items ? (*items)->size() : 0;
    }
    if (const auto* members = std::get_if<ObjectPtr>(&m_data)) {
        return *members ? (*members)->size() : 0;
    }
    return 0;
}

bool JsonValue::shares_storage_with(const JsonValue& other) const noexcept
{
    if (const auto* lhs = std::get_if<ArrayPtr>(&m_data)) {
        const auto* rhs = std::get_if<ArrayPtr>(&other.m_data);
        return rhs != nullptr && *lhs == *rhs;
    }
    if (const auto* lhs = std::get_if<ObjectPtr>(&m_data)) {
        const auto* rhs = std::get_if<ObjectPtr>(&other.m_data);
        return rhs != nullptr && *lhs == *rhs;
    }
    return false;
}

bool operator==(const JsonValue& lhs, const JsonValue& rhs)
{
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    if (lhs.shares_storage_with(rhs)) {
        return true;
    }
    switch (lhs.kind()) {
        case JsonKind::kNull:
            return true;
        case JsonKind::kBool:
            return lhs.as_bool() == rhs.as_bool();
        case JsonKind::kNumber:
            return lhs.as_number() == rhs.as_number();
        case JsonKind::kString:
            return lhs.as_string() == rhs.as_string();
        case JsonKind::kArray:
            return lhs.as_array() == rhs.as_array();
        case JsonKind::kObject: {
            // Member order is not significant.
            const auto& left = lhs.as_object();
            if (left.size() != rhs.size()) {
                return false;
            }
            for (const auto& [key, value] : left) {
                const JsonValue* other = rhs.find(key);
                if (other == nullptr || !(value == *other)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

}  // namespace qoeguard

namespace qoeguard::json {

namespace {

/// Scalar conversion; nullopt for arrays and objects
template <typename BasicJson>
[[nodiscard]] std::optional<JsonValue> convert_scalar(const BasicJson& j)
{
    switch (j.type()) {
        case BasicJson::value_t::boolean:
            return JsonValue::boolean(j.template get<bool>());
        case BasicJson::value_t::number_integer:
        case BasicJson::value_t::number_unsigned:
        case BasicJson::value_t::number_float:
            return JsonValue::number(j.template get<double>());
        case BasicJson::value_t::string:
            return JsonValue::string(j.template get<std::string>());
        case BasicJson::value_t::array:
        case BasicJson::value_t::object:
            return std::nullopt;
        case BasicJson::value_t::null:
        case BasicJson::value_t::binary:
        case BasicJson::value_t::discarded:
            break;
    }
    return JsonValue::null();
}

template <typename BasicJson>
struct ConvertFrame
{
    const BasicJson* node = nullptr;
    typename BasicJson::const_iterator next;
    std::string key;  ///< Member name in the parent object
    JsonValue::Array items;
    JsonValue::Object members;
};

template <typename BasicJson>
void attach(ConvertFrame<BasicJson>& parent, std::string key, JsonValue value)
{
    if (parent.node->is_object()) {
        parent.members.emplace_back(std::move(key), std::move(value));
    } else {
        parent.items.push_back(std::move(value));
    }
}

/// Depth-first conversion over an explicit stack of open containers
template <typename BasicJson>
[[nodiscard]] JsonValue convert(const BasicJson& root)
{
    if (auto leaf = convert_scalar(root)) {
        return std::move(*leaf);
    }

    std::vector<ConvertFrame<BasicJson>> stack;
    stack.push_back(ConvertFrame<BasicJson>{.node = &root, .next = root.cbegin()});
    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.next != frame.node->cend()) {
            const auto it = frame.next++;
            std::string key = frame.node->is_object() ? it.key() : std::string{};
            if (auto leaf = convert_scalar(*it)) {
                attach(frame, std::move(key), std::move(*leaf));
            } else {
                const BasicJson& child = *it;
                stack.push_back(ConvertFrame<BasicJson>{
                    .node = &child, .next = child.cbegin(), .key = std::move(key)});
            }
            continue;
        }

        JsonValue done = frame.node->is_object() ? JsonValue::object(std::move(frame.members))
                                                 : JsonValue::array(std::move(frame.items));
        std::string key = std::move(frame.key);
        stack.pop_back();
        if (stack.empty()) {
            return done;
        }
        attach(stack.back(), std::move(key), std::move(done));
    }
    return JsonValue::null();
}

constexpr double kMaxExactInteger = 9'007'199'254'740'992.0;  // 2^53

[[nodiscard]] nlohmann::json number_to_nlohmann(double value)
{
    if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) <= kMaxExactInteger) {
        return static_cast<std::int64_t>(value);
    }
    return value;
}

}  // namespace

JsonValue from_nlohmann(const nlohmann::ordered_json& j)
{
    return convert(j);
}

JsonValue from_nlohmann(const nlohmann::json& j)
{
    return convert(j);
}

nlohmann::json to_nlohmann(const JsonValue& value)
{
    switch (value.kind()) {
        case JsonKind::kNull:
            return nullptr;
        case JsonKind::kBool:
            return value.as_bool();
        case JsonKind::kNumber:
            return number_to_nlohmann(value.as_number());
        case JsonKind::kString:
            return value.as_string();
        case JsonKind::kArray: {
            nlohmann::json result = nlohmann::json::array();
            for (const auto& item : value.as_array()) {
                result.push_back(to_nlohmann(item));
            }
            return result;
        }
        case JsonKind::kObject: {
            nlohmann::json result = nlohmann::json::object();
            for (const auto& [key, member] : value.as_object()) {
                result[key] = to_nlohmann(member);
            }
            return result;
        }
    }
    return nullptr;
}

qoeguard::Result<JsonValue> parse(std::string_view text)
{
    try {
        return from_nlohmann(nlohmann::ordered_json::parse(text));
    } catch (const std::exception& ex) {
        return std::unexpected(
            qoeguard::Error::make("ParseError", std::string("Failed to parse JSON: ") + ex.what()));
    }
}

qoeguard::Result<JsonValue> read_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            qoeguard::Error::make("IOError", "Failed to open JSON file: " + path));
    }
    nlohmann::ordered_json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(qoeguard::Error::make(
            "ParseError", "Failed to parse JSON file: " + path + ": " + ex.what()));
    }
    return from_nlohmann(payload);
}

}  // namespace qoeguard::json
