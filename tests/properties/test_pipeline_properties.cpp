/**
 * @file test_pipeline_properties.cpp
 * @brief Randomized invariants of whole evaluations under streaming criticality
 */

#include "qoeguard/pipeline.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace qoeguard::pipeline::test {

namespace {

constexpr std::uint32_t kSeed = 20240612;
constexpr int kIterations = 300;
constexpr int kMaxDepth = 3;

/**
 * @brief Seeded payload generator over streaming-style keys
 *
 * Top-level keys are drawn from a pool that overlaps the streaming
 * criticality rules, so critical and non-critical drift both occur.
 */
class PayloadGenerator
{
public:
    explicit PayloadGenerator(std::uint32_t seed)
        : m_rng(seed)
    {}

    JsonValue document()
    {
        // Absent documents are null.
        if (uniform(0, 9) == 0) {
            return JsonValue::null();
        }
        return object(0);
    }

    JsonValue mutate(const JsonValue& base, int depth)
    {
        if (uniform(0, 7) == 0) {
            return depth == 0 ? document() : value(depth);
        }
        switch (base.kind()) {
            case JsonKind::kObject: {
                JsonValue::Object members;
                for (const auto& [key, member] : base.as_object()) {
                    const int action = uniform(0, 4);
                    if (action == 0) {
                        continue;
                    }
                    members.emplace_back(key, action == 1 ? mutate(member, depth + 1) : member);
                }
                if (uniform(0, 2) == 0) {
                    members.emplace_back(key_for(depth), value(depth + 1));
                }
                return JsonValue::object(std::move(members));
            }
            case JsonKind::kArray: {
                JsonValue::Array items;
                for (const auto& item : base.as_array()) {
                    items.push_back(uniform(0, 3) == 0 ? mutate(item, depth + 1) : item);
                }
                if (!items.empty() && uniform(0, 3) == 0) {
                    items.pop_back();
                }
                if (uniform(0, 3) == 0) {
                    items.push_back(value(depth + 1));
                }
                return JsonValue::array(std::move(items));
            }
            case JsonKind::kNumber:
                return JsonValue::number(base.as_number() * static_cast<double>(uniform(0, 3))
                                         + static_cast<double>(uniform(-50, 50)));
            default:
                return value(depth);
        }
    }

private:
    int uniform(int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(m_rng); }

    std::string key_for(int depth)
    {
        static const std::vector<std::string> kTopLevel = {
            "playback", "drm", "ads", "auth", "title", "meta", "recommendations"};
        static const std::vector<std::string> kNested = {"url", "bitrate", "codec", "items", "id"};
        const auto& pool = depth == 0 ? kTopLevel : kNested;
        return pool[static_cast<std::size_t>(uniform(0, static_cast<int>(pool.size()) - 1))];
    }

    JsonValue value(int depth)
    {
        switch (uniform(0, depth >= kMaxDepth ? 3 : 5)) {
            case 0:
                return JsonValue::null();
            case 1:
                return JsonValue::boolean(uniform(0, 1) == 1);
            case 2:
                return JsonValue::number(static_cast<double>(uniform(-100000, 100000)));
            case 3:
                return JsonValue::string(std::format("v{}", uniform(0, 9)));
            case 4: {
                JsonValue::Array items;
                for (int i = uniform(0, 4); i > 0; --i) {
                    items.push_back(value(depth + 1));
                }
                return JsonValue::array(std::move(items));
            }
            default:
                return object(depth + 1);
        }
    }

    JsonValue object(int depth)
    {
        JsonValue::Object members;
        for (int i = uniform(0, 5); i > 0; --i) {
            members.emplace_back(key_for(depth), value(depth + 1));
        }
        return JsonValue::object(std::move(members));
    }

    std::mt19937 m_rng;
};

void expect_well_formed(const Evaluation& evaluation, const config::Config& config)
{
    const auto& decision = evaluation.decision;
    EXPECT_TRUE(std::isfinite(decision.risk));
    EXPECT_GE(decision.risk, 0.0);
    EXPECT_LE(decision.risk, 1.0);
    EXPECT_EQ(decision.risk, decision.score.risk);

    ASSERT_EQ(decision.score.contributions.size(), features::kFeatureCount);
    for (std::size_t i = 0; i < features::kFeatureCount; ++i) {
        EXPECT_EQ(decision.score.contributions[i].feature, features::kAllFeatures[i]);
        EXPECT_TRUE(std::isfinite(decision.score.contributions[i].value));
    }

    const auto verdict = decision.verdict;
    EXPECT_TRUE(verdict == config::Verdict::kPass || verdict == config::Verdict::kWarn
                || verdict == config::Verdict::kFail);
    if (!decision.override_rule) {
        EXPECT_EQ(verdict, policy::band_for(decision.risk, config.policy));
    }

    EXPECT_LE(decision.top_signals.size(), config.policy.top_n());
    for (const auto& signal : decision.top_signals) {
        EXPECT_TRUE(std::isfinite(policy::signal_contribution(signal)));
    }
}

qoeguard::Result<config::Config> tree_config()
{
    return config::parse_config({
        {"policy", {{"preset", "strict"}, {"top_n", 3}}},
        {"model",
         {{"kind", "decision_tree"},
          {"nodes",
           {{{"feature", "critical_changes"}, {"threshold", 0}, {"left", 1}, {"right", 2}, {"value", 0.3}},
            {{"value", 0.05}},
            {{"feature", "type_changes"}, {"threshold", 1}, {"left", 3}, {"right", 4}, {"value", 0.7}},
            {{"value", 0.55}},
            {{"value", 0.95}}}}}},
    });
}

}  // namespace

TEST(EvaluationProperties, LinearModelOutputsStayInRange)
{
    auto evaluator = Evaluator::create(config::Config{});
    ASSERT_TRUE(evaluator) << evaluator.error().message;

    PayloadGenerator generator(kSeed);
    for (int i = 0; i < kIterations; ++i) {
        const auto baseline = generator.document();
        const auto candidate = generator.mutate(baseline, 0);
        expect_well_formed(evaluator->evaluate(baseline, candidate), evaluator->config());
    }
}

TEST(EvaluationProperties, DecisionTreeOutputsStayInRange)
{
    auto config = tree_config();
    ASSERT_TRUE(config) << config.error().message;
    auto evaluator = Evaluator::create(std::move(*config));
    ASSERT_TRUE(evaluator) << evaluator.error().message;

    PayloadGenerator generator(kSeed + 1);
    for (int i = 0; i < kIterations; ++i) {
        const auto baseline = generator.document();
        const auto candidate = generator.mutate(baseline, 0);
        expect_well_formed(evaluator->evaluate(baseline, candidate), evaluator->config());
    }
}

TEST(EvaluationProperties, AbsentSideIsOneWholeDocumentChange)
{
    auto evaluator = Evaluator::create(config::Config{});
    ASSERT_TRUE(evaluator) << evaluator.error().message;

    PayloadGenerator generator(kSeed + 2);
    int checked = 0;
    while (checked < 50) {
        const auto present = generator.document();
        if (present.is_null()) {
            continue;
        }
        ++checked;

        const auto appeared = evaluator->evaluate(JsonValue::null(), present);
        ASSERT_EQ(appeared.changes.size(), 1U);
        EXPECT_EQ(appeared.changes[0].kind, diff::ChangeKind::kAdded);
        EXPECT_TRUE(appeared.changes[0].path.is_root());
        EXPECT_EQ(appeared.extraction.features.added_fields, 1U);
        EXPECT_EQ(appeared.extraction.features.type_changes, 0U);
        expect_well_formed(appeared, evaluator->config());

        const auto vanished = evaluator->evaluate(present, JsonValue::null());
        ASSERT_EQ(vanished.changes.size(), 1U);
        EXPECT_EQ(vanished.changes[0].kind, diff::ChangeKind::kRemoved);
        EXPECT_EQ(vanished.extraction.features.removed_fields, 1U);
        expect_well_formed(vanished, evaluator->config());
    }
}

}  // namespace qoeguard::pipeline::test
