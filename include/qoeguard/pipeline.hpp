#pragma once

/**
 * @file pipeline.hpp
 * @brief Diff, extract, score and decide in one call
 */

#include "qoeguard/common.hpp"
#include "qoeguard/config.hpp"
#include "qoeguard/diff.hpp"
#include "qoeguard/features.hpp"
#include "qoeguard/json_value.hpp"
#include "qoeguard/policy.hpp"
#include "qoeguard/scoring.hpp"

#include <cstddef>
#include <memory>

namespace qoeguard::pipeline {

struct Evaluation
{
    diff::ChangeList changes;               ///< After ignore_paths filtering
    std::size_t ignored_change_count = 0;   ///< Changes dropped by ignore_paths
    features::Extraction extraction;
    policy::Decision decision;
};

/**
 * @brief Reusable, thread-safe evaluator bound to one configuration
 *
 * evaluate() is const and touches no shared mutable state, so one Evaluator
 * may serve any number of concurrent callers.
 */
class Evaluator
{
public:
    [[nodiscard]] static qoeguard::Result<Evaluator> create(config::Config config);

    [[nodiscard]] Evaluation evaluate(const JsonValue& baseline, const JsonValue& candidate) const;

    [[nodiscard]] const config::Config& config() const noexcept { return m_config; }
    [[nodiscard]] const scoring::ScoringModel& model() const noexcept { return *m_model; }

private:
    Evaluator(config::Config config, std::shared_ptr<const scoring::ScoringModel> model)
        : m_config(std::move(config))
        , m_model(std::move(model))
    {}

    [[nodiscard]] bool is_ignored(const Path& path) const noexcept;

    config::Config m_config;
    std::shared_ptr<const scoring::ScoringModel> m_model;
};

/// One-shot evaluation with the given configuration
[[nodiscard]] qoeguard::Result<Evaluation> evaluate(const JsonValue& baseline,
                                                    const JsonValue& candidate,
                                                    const config::Config& config);

}  // namespace qoeguard::pipeline
