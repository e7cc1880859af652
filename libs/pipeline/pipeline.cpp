/**
 * @file pipeline.cpp
 * @brief End-to-end evaluation of a baseline/candidate pair
 */

#include "qoeguard/pipeline.hpp"

#include <algorithm>
#include <utility>

namespace qoeguard::pipeline {

qoeguard::Result<Evaluator> Evaluator::create(config::Config config)
{
    auto model = scoring::make_model(config);
    if (!model) {
        return std::unexpected(model.error());
    }
    return Evaluator(std::move(config), std::move(*model));
}

bool Evaluator::is_ignored(const Path& path) const noexcept
{
    return std::ranges::any_of(m_config.ignore_paths, [&path](const PathPattern& pattern) {
        return pattern.matches_prefix_of(path);
    });
}

Evaluation Evaluator::evaluate(const JsonValue& baseline, const JsonValue& candidate) const
{
    Evaluation result;
    for (auto& change : diff::diff(baseline, candidate)) {
        if (is_ignored(change.path)) {
            ++result.ignored_change_count;
            continue;
        }
        result.changes.push_back(std::move(change));
    }

    result.extraction = features::extract(result.changes, m_config.criticality);
    const scoring::Score score = m_model->score(result.extraction.features);
    result.decision = policy::decide(score, result.extraction, m_config.policy);
    return result;
}

qoeguard::Result<Evaluation> evaluate(const JsonValue& baseline,
                                      const JsonValue& candidate,
                                      const config::Config& config)
{
    auto evaluator = Evaluator::create(config);
    if (!evaluator) {
        return std::unexpected(evaluator.error());
    }
    return evaluator->evaluate(baseline, candidate);
}

}  // namespace qoeguard::pipeline
