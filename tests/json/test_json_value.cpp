/**
 * @file test_json_value.cpp
 * @brief JsonValue construction, equality and conversion tests
 */

#include "qoeguard/json_value.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using qoeguard::JsonKind;
using qoeguard::JsonValue;

namespace {

JsonValue parse_json(std::string_view text)
{
    auto parsed = qoeguard::json::parse(text);
    EXPECT_TRUE(parsed) << (parsed ? "" : parsed.error().message);
    return parsed ? *parsed : JsonValue::null();
}

}  // namespace

TEST(JsonValueTest, KindsFromParse)
{
    EXPECT_EQ(parse_json("null").kind(), JsonKind::kNull);
    EXPECT_EQ(parse_json("true").kind(), JsonKind::kBool);
    EXPECT_EQ(parse_json("8000").kind(), JsonKind::kNumber);
    EXPECT_EQ(parse_json("1.5").kind(), JsonKind::kNumber);
    EXPECT_EQ(parse_json(R"("x")").kind(), JsonKind::kString);
    EXPECT_EQ(parse_json("[1]").kind(), JsonKind::kArray);
    EXPECT_EQ(parse_json(R"({"a":1})").kind(), JsonKind::kObject);
}

TEST(JsonValueTest, IntegerAndFloatAreTheSameNumber)
{
    EXPECT_EQ(parse_json("8000"), parse_json("8000.0"));
}

TEST(JsonValueTest, ObjectEqualityIgnoresMemberOrder)
{
    EXPECT_EQ(parse_json(R"({"a":1,"b":[1,2]})"), parse_json(R"({"b":[1,2],"a":1})"));
    EXPECT_NE(parse_json(R"({"a":1})"), parse_json(R"({"a":1,"b":2})"));
}

TEST(JsonValueTest, ArrayEqualityIsPositional)
{
    EXPECT_NE(parse_json("[1,2]"), parse_json("[2,1]"));
}

TEST(JsonValueTest, ParseKeepsMemberOrder)
{
    const auto value = parse_json(R"({"z":1,"a":2,"m":3})");
    const auto& members = value.as_object();
    ASSERT_EQ(members.size(), 3U);
    EXPECT_EQ(members[0].first, "z");
    EXPECT_EQ(members[1].first, "a");
    EXPECT_EQ(members[2].first, "m");
}

TEST(JsonValueTest, DuplicateKeysKeepFirstPositionLastValue)
{
    const auto value = JsonValue::object({
        {"a", JsonValue::number(1)},
        {"b", JsonValue::number(2)},
        {"a", JsonValue::number(3)},
    });
    const auto& members = value.as_object();
    ASSERT_EQ(members.size(), 2U);
    EXPECT_EQ(members[0].first, "a");
    EXPECT_EQ(members[0].second.as_number(), 3.0);
    EXPECT_EQ(members[1].first, "b");
}

TEST(JsonValueTest, FindAndSize)
{
    const auto value = parse_json(R"({"playback":{"url":"u"},"ads":[]})");
    ASSERT_NE(value.find("playback"), nullptr);
    EXPECT_EQ(value.find("missing"), nullptr);
    EXPECT_EQ(value.size(), 2U);
    EXPECT_EQ(parse_json("7").find("x"), nullptr);
    EXPECT_EQ(parse_json("7").size(), 0U);
}

TEST(JsonValueTest, AccessorKindMismatchThrows)
{
    EXPECT_THROW((void)parse_json("1").as_string(), std::logic_error);
    EXPECT_THROW((void)parse_json(R"("1")").as_number(), std::logic_error);
}

TEST(JsonValueTest, CopiesShareStorage)
{
    const auto value = parse_json(R"({"a":[1,2,3]})");
    const JsonValue copy = value;  // NOLINT(performance-unnecessary-copy-initialization)
    EXPECT_TRUE(copy.shares_storage_with(value));
    EXPECT_FALSE(parse_json("[]").shares_storage_with(parse_json("[]")));
}

TEST(JsonValueTest, ToNlohmannRendersIntegralNumbersAsIntegers)
{
    const auto converted = qoeguard::json::to_nlohmann(parse_json(R"({"bitrate":8000,"ratio":0.5})"));
    EXPECT_EQ(converted.dump(), R"({"bitrate":8000,"ratio":0.5})");
}

TEST(JsonValueTest, FromNlohmannRoundTripsStructure)
{
    const nlohmann::json source = {
        {"playback", {{"drm", "widevine"}, {"bitrates", {800, 1600}}}},
        {"live", true},
        {"note", nullptr},
    };
    const auto value = qoeguard::json::from_nlohmann(source);
    EXPECT_EQ(qoeguard::json::to_nlohmann(value), source);
}

TEST(JsonValueTest, ParseErrorIsReported)
{
    auto parsed = qoeguard::json::parse("{\"a\":");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, "ParseError");
}

TEST(JsonValueTest, ReadMissingFileIsIOError)
{
    auto parsed = qoeguard::json::read_file("/nonexistent/qoeguard/payload.json");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, "IOError");
}

TEST(JsonValueTest, DeeplyNestedDocumentParsesAndReleases)
{
    constexpr std::size_t kDepth = 100000;
    std::string text(kDepth, '[');
    text += R"({"leaf":7})";
    text.append(kDepth, ']');

    {
        const auto value = parse_json(text);
        const JsonValue* cursor = &value;
        std::size_t depth = 0;
        while (cursor->is_array()) {
            ASSERT_EQ(cursor->size(), 1U);
            cursor = &cursor->as_array().front();
            ++depth;
        }
        EXPECT_EQ(depth, kDepth);
        ASSERT_NE(cursor->find("leaf"), nullptr);
        EXPECT_EQ(cursor->find("leaf")->as_number(), 7.0);
    }
}

TEST(JsonValueTest, ReleasingOneCopyKeepsSharedChildren)
{
    const auto shared = parse_json(R"({"items":[[1],[2]]})");
    JsonValue outer = JsonValue::array({shared, shared});
    outer = JsonValue::null();
    ASSERT_EQ(shared.find("items")->size(), 2U);
    EXPECT_EQ(shared.find("items")->as_array()[1], parse_json("[2]"));
}
