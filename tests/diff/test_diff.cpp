/**
 * @file test_diff.cpp
 * @brief Hierarchical diff tests
 */

#include "qoeguard/diff.hpp"

#include <gtest/gtest.h>

using qoeguard::JsonValue;
using qoeguard::diff::ChangeKind;
using qoeguard::diff::diff;

namespace {

JsonValue parse_json(std::string_view text)
{
    auto parsed = qoeguard::json::parse(text);
    EXPECT_TRUE(parsed) << text;
    return parsed ? *parsed : JsonValue::null();
}

std::vector<std::string> rendered_paths(const qoeguard::diff::ChangeList& changes)
{
    std::vector<std::string> paths;
    paths.reserve(changes.size());
    for (const auto& change : changes) {
        paths.push_back(change.path.to_string());
    }
    return paths;
}

}  // namespace

TEST(DiffTest, IdenticalPayloadHasNoChanges)
{
    const auto payload = parse_json(R"({"playback":{"url":"https://cdn/a.m3u8","bitrate":8000},"ads":[1,2]})");
    EXPECT_TRUE(diff(payload, payload).empty());
    EXPECT_TRUE(diff(payload, parse_json(R"({"ads":[1,2],"playback":{"bitrate":8000,"url":"https://cdn/a.m3u8"}})")).empty());
}

TEST(DiffTest, AddedAndRemovedFields)
{
    const auto changes = diff(parse_json(R"({"a":1,"b":2})"), parse_json(R"({"b":2,"c":3})"));
    ASSERT_EQ(changes.size(), 2U);
    EXPECT_EQ(changes[0].path.to_string(), "$.a");
    EXPECT_EQ(changes[0].kind, ChangeKind::kRemoved);
    ASSERT_TRUE(changes[0].old_value);
    EXPECT_FALSE(changes[0].new_value);
    EXPECT_EQ(changes[1].path.to_string(), "$.c");
    EXPECT_EQ(changes[1].kind, ChangeKind::kAdded);
    EXPECT_FALSE(changes[1].old_value);
    ASSERT_TRUE(changes[1].new_value);
}

TEST(DiffTest, RemovedSubtreeIsOneChange)
{
    const auto changes =
        diff(parse_json(R"({"drm":{"license":"x","type":"widevine"}})"), parse_json("{}"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].path.to_string(), "$.drm");
    EXPECT_EQ(changes[0].kind, ChangeKind::kRemoved);
    EXPECT_EQ(*changes[0].old_value, parse_json(R"({"type":"widevine","license":"x"})"));
}

TEST(DiffTest, NumberToStringIsTypeChange)
{
    const auto changes = diff(parse_json(R"({"playback":{"bitrate":8000}})"),
                              parse_json(R"({"playback":{"bitrate":"8000"}})"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].path.to_string(), "$.playback.bitrate");
    EXPECT_EQ(changes[0].kind, ChangeKind::kTypeChanged);
    EXPECT_FALSE(changes[0].numeric_delta);
}

TEST(DiffTest, NullVersusValueIsTypeChange)
{
    const auto changes = diff(parse_json(R"({"a":null})"), parse_json(R"({"a":0})"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].kind, ChangeKind::kTypeChanged);
}

TEST(DiffTest, RootTypeChange)
{
    const auto changes = diff(parse_json("[]"), parse_json("{}"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_TRUE(changes[0].path.is_root());
    EXPECT_EQ(changes[0].kind, ChangeKind::kTypeChanged);
}

TEST(DiffTest, AbsentBaselineIsWholeDocumentAdded)
{
    const auto candidate = parse_json(R"({"playback":{"url":"https://cdn/a.m3u8"}})");
    const auto changes = diff(JsonValue::null(), candidate);
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_TRUE(changes[0].path.is_root());
    EXPECT_EQ(changes[0].kind, ChangeKind::kAdded);
    EXPECT_FALSE(changes[0].old_value);
    ASSERT_TRUE(changes[0].new_value);
    EXPECT_EQ(*changes[0].new_value, candidate);
}

TEST(DiffTest, AbsentCandidateIsWholeDocumentRemoved)
{
    const auto baseline = parse_json("[1,2,3]");
    const auto changes = diff(baseline, parse_json("null"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].path.to_string(), "$");
    EXPECT_EQ(changes[0].kind, ChangeKind::kRemoved);
    ASSERT_TRUE(changes[0].old_value);
    EXPECT_EQ(*changes[0].old_value, baseline);
    EXPECT_FALSE(changes[0].new_value);
}

TEST(DiffTest, AbsentScalarDocumentIsAddedNotTypeChanged)
{
    const auto changes = diff(JsonValue::null(), JsonValue::number(3));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].kind, ChangeKind::kAdded);
    EXPECT_TRUE(diff(JsonValue::null(), JsonValue::null()).empty());
}

TEST(DiffTest, NestedNullStaysTypeChange)
{
    const auto changes = diff(parse_json(R"({"drm":{"license":null}})"),
                              parse_json(R"({"drm":{"license":{"url":"x"}}})"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].path.to_string(), "$.drm.license");
    EXPECT_EQ(changes[0].kind, ChangeKind::kTypeChanged);
}

TEST(DiffTest, NumericValueChangeCarriesDelta)
{
    const auto changes = diff(parse_json(R"({"bitrate":8000})"), parse_json(R"({"bitrate":6500})"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].kind, ChangeKind::kValueChanged);
    ASSERT_TRUE(changes[0].numeric_delta);
    EXPECT_DOUBLE_EQ(*changes[0].numeric_delta, 1500.0);
}

TEST(DiffTest, StringAndBoolValueChangesHaveNoDelta)
{
    const auto changes = diff(parse_json(R"({"s":"a","b":true})"), parse_json(R"({"s":"b","b":false})"));
    ASSERT_EQ(changes.size(), 2U);
    for (const auto& change : changes) {
        EXPECT_EQ(change.kind, ChangeKind::kValueChanged);
        EXPECT_FALSE(change.numeric_delta);
    }
}

TEST(DiffTest, ArrayShrinkEmitsLengthMarkerThenRemoved)
{
    const auto changes = diff(parse_json("[1,2,3]"), parse_json("[1,2]"));
    ASSERT_EQ(changes.size(), 2U);
    EXPECT_EQ(changes[0].path.to_string(), "$.__len__");
    EXPECT_TRUE(changes[0].is_length_marker());
    EXPECT_EQ(changes[0].kind, ChangeKind::kValueChanged);
    EXPECT_EQ(changes[0].old_value->as_number(), 3.0);
    EXPECT_EQ(changes[0].new_value->as_number(), 2.0);
    EXPECT_DOUBLE_EQ(*changes[0].numeric_delta, 1.0);
    EXPECT_EQ(changes[1].path.to_string(), "$[2]");
    EXPECT_EQ(changes[1].kind, ChangeKind::kRemoved);
}

TEST(DiffTest, ArrayGrowthEmitsAddedElements)
{
    const auto changes = diff(parse_json(R"({"ads":[1]})"), parse_json(R"({"ads":[1,2,3]})"));
    EXPECT_EQ(rendered_paths(changes),
              (std::vector<std::string>{"$.ads.__len__", "$.ads[1]", "$.ads[2]"}));
    EXPECT_EQ(changes[1].kind, ChangeKind::kAdded);
    EXPECT_EQ(changes[2].kind, ChangeKind::kAdded);
}

TEST(DiffTest, ArrayElementsComparedByIndex)
{
    const auto changes =
        diff(parse_json(R"([{"id":1},{"id":2}])"), parse_json(R"([{"id":1},{"id":5}])"));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].path.to_string(), "$[1].id");
}

TEST(DiffTest, OrderFollowsBaselineThenCandidateAdditions)
{
    const auto changes = diff(parse_json(R"({"z":1,"a":{"x":1},"m":1})"),
                              parse_json(R"({"new2":0,"m":2,"a":{"x":2,"y":1},"new1":0})"));
    EXPECT_EQ(rendered_paths(changes),
              (std::vector<std::string>{"$.z", "$.a.x", "$.a.y", "$.m", "$.new2", "$.new1"}));
}

TEST(DiffTest, SharedSubtreesAreSkipped)
{
    const auto shared = parse_json(R"({"x":[1,2,3]})");
    const auto before = JsonValue::object({{"a", shared}, {"b", JsonValue::number(1)}});
    const auto after = JsonValue::object({{"a", shared}, {"b", JsonValue::number(2)}});
    const auto changes = diff(before, after);
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].path.to_string(), "$.b");
}

TEST(DiffTest, ChangeKindNames)
{
    EXPECT_EQ(qoeguard::diff::change_kind_name(ChangeKind::kAdded), "added");
    EXPECT_EQ(qoeguard::diff::change_kind_name(ChangeKind::kRemoved), "removed");
    EXPECT_EQ(qoeguard::diff::change_kind_name(ChangeKind::kTypeChanged), "type_changed");
    EXPECT_EQ(qoeguard::diff::change_kind_name(ChangeKind::kValueChanged), "value_changed");
}

namespace {

constexpr std::size_t kDeepNesting = 100000;

JsonValue nested_arrays(std::size_t depth, double leaf)
{
    JsonValue value = JsonValue::number(leaf);
    for (std::size_t i = 0; i < depth; ++i) {
        value = JsonValue::array({value});
    }
    return value;
}

JsonValue nested_objects(std::size_t depth, double leaf)
{
    JsonValue value = JsonValue::number(leaf);
    for (std::size_t i = 0; i < depth; ++i) {
        value = JsonValue::object({{"k", value}});
    }
    return value;
}

}  // namespace

TEST(DiffTest, DeeplyNestedArraysDiffWithoutRecursion)
{
    const auto changes = diff(nested_arrays(kDeepNesting, 1), nested_arrays(kDeepNesting, 2));
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].kind, ChangeKind::kValueChanged);
    EXPECT_EQ(changes[0].path.depth(), kDeepNesting);
    ASSERT_TRUE(changes[0].numeric_delta);
    EXPECT_DOUBLE_EQ(*changes[0].numeric_delta, 1.0);
}

TEST(DiffTest, DeeplyNestedObjectsDiffWithoutRecursion)
{
    const auto before = nested_objects(kDeepNesting, 1);
    const auto after = JsonValue::object(
        {{"k", nested_objects(kDeepNesting - 1, 1)}, {"extra", JsonValue::boolean(true)}});
    const auto changes = diff(before, after);
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].kind, ChangeKind::kAdded);
    EXPECT_EQ(changes[0].path.to_string(), "$.extra");
}

TEST(DiffTest, SiblingAfterDeepSubtreeKeepsItsPath)
{
    const auto entry = [](double b) {
        return JsonValue::object({{"a", JsonValue::number(1)}, {"b", JsonValue::number(b)}});
    };
    const auto before = JsonValue::array({nested_arrays(1000, 0), entry(1)});
    const auto after = JsonValue::array({nested_arrays(1000, 0), entry(2)});
    const auto changes = diff(before, after);
    ASSERT_EQ(changes.size(), 1U);
    EXPECT_EQ(changes[0].path.to_string(), "$[1].b");
}
