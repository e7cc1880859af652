/**
 * @file scoring.cpp
 * @brief Linear-logistic and decision-tree scoring
 */

#include "qoeguard/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace qoeguard::scoring {

namespace {

[[nodiscard]] std::array<Contribution, features::kFeatureCount> zero_contributions()
{
    std::array<Contribution, features::kFeatureCount> table{};
    for (features::Feature feature : features::kAllFeatures) {
        table[features::feature_index(feature)] = Contribution{.feature = feature, .value = 0.0};
    }
    return table;
}

}  // namespace

double sigmoid(double z) noexcept
{
    if (std::isnan(z)) {
        return 0.5;
    }
    double risk = 0.0;
    if (z >= 0.0) {
        risk = 1.0 / (1.0 + std::exp(-z));
    } else {
        const double e = std::exp(z);
        risk = e / (1.0 + e);
    }
    return std::clamp(risk, 0.0, 1.0);
}

Score LinearLogisticModel::score(const features::FeatureVector& fv) const
{
    Score result{
        .model = std::string(name()),
        .risk = 0.0,
        .baseline = m_weights.bias(),
        .z = std::nullopt,
        .contributions = zero_contributions(),
    };

    double z = m_weights.bias();
    for (features::Feature feature : features::kAllFeatures) {
        const double normalized = m_weights.normalize(feature, fv.value(feature));
        const double contribution = common::saturate(m_weights.weight(feature).weight * normalized);
        result.contributions[features::feature_index(feature)].value = contribution;
        z = common::saturating_add(z, contribution);
    }
    result.z = z;
    result.risk = sigmoid(z);
    return result;
}

Score DecisionTreeModel::score(const features::FeatureVector& fv) const
{
    const auto& nodes = m_tree.nodes();
    Score result{
        .model = std::string(name()),
        .risk = 0.0,
        .baseline = nodes.front().value,
        .z = std::nullopt,
        .contributions = zero_contributions(),
    };

    // Children always have larger indices than their parent, so this terminates.
    std::size_t current = 0;
    while (!nodes[current].is_leaf()) {
        const config::TreeNode& node = nodes[current];
        const std::size_t next =
            fv.value(*node.feature) <= node.threshold ? *node.left : *node.right;
        result.contributions[features::feature_index(*node.feature)].value +=
            nodes[next].value - node.value;
        current = next;
    }
    result.risk = std::clamp(nodes[current].value, 0.0, 1.0);
    return result;
}

Score score(const features::FeatureVector& fv, const config::WeightConfig& weights)
{
    return LinearLogisticModel(weights).score(fv);
}

qoeguard::Result<std::shared_ptr<const ScoringModel>> make_model(const config::Config& config)
{
    switch (config.model.kind) {
        case config::ModelKind::kLinear:
            return std::make_shared<const LinearLogisticModel>(config.weights);
        case config::ModelKind::kDecisionTree:
            if (!config.model.tree) {
                return std::unexpected(qoeguard::Error::make(
                    "InvalidConfig", "decision_tree model selected without a tree"));
            }
            return std::make_shared<const DecisionTreeModel>(*config.model.tree);
    }
    return std::unexpected(qoeguard::Error::make("InvalidConfig", "unknown scoring model"));
}

}  // namespace qoeguard::scoring
