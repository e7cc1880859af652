#pragma once

/**
 * @file scoring.hpp
 * @brief Risk scoring models over feature vectors
 */

#include "qoeguard/common.hpp"
#include "qoeguard/config.hpp"
#include "qoeguard/feature_vector.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace qoeguard::scoring {

struct Contribution
{
    features::Feature feature = features::Feature::kAddedFields;
    double value = 0.0;  ///< Signed share of the score attributed to the feature

    bool operator==(const Contribution&) const = default;
};

struct Score
{
    std::string model;      ///< "linear" or "decision_tree"
    double risk = 0.0;      ///< In [0,1]
    double baseline = 0.0;  ///< Bias (linear) or root estimate (tree)
    std::optional<double> z;  ///< Logit; linear model only

    /// One entry per feature in canonical order
    std::array<Contribution, features::kFeatureCount> contributions{};

    [[nodiscard]] double contribution(features::Feature feature) const noexcept
    {
        return contributions[features::feature_index(feature)].value;
    }

    bool operator==(const Score&) const = default;
};

/**
 * @brief Scoring strategy interface
 *
 * Implementations are immutable after construction and safe to share
 * across threads.
 */
class ScoringModel
{
public:
    virtual ~ScoringModel() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual Score score(const features::FeatureVector& fv) const = 0;
};

/**
 * @brief Weighted sum of normalized features through a logistic function
 *
 * contribution_i = weight_i * min(raw_i / scale_i, cap_i)
 * risk = 1 / (1 + exp(-(bias + sum contribution_i)))
 *
 * With non-negative weights, risk never decreases when a feature grows.
 */
class LinearLogisticModel final : public ScoringModel
{
public:
    explicit LinearLogisticModel(config::WeightConfig weights)
        : m_weights(weights)
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return "linear"; }
    [[nodiscard]] Score score(const features::FeatureVector& fv) const override;

private:
    config::WeightConfig m_weights;
};

/**
 * @brief Fixed decision tree; contributions are the estimate deltas along
 * the decision path, credited to the feature split on
 */
class DecisionTreeModel final : public ScoringModel
{
public:
    explicit DecisionTreeModel(config::DecisionTreeConfig tree)
        : m_tree(std::move(tree))
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return "decision_tree"; }
    [[nodiscard]] Score score(const features::FeatureVector& fv) const override;

private:
    config::DecisionTreeConfig m_tree;
};

/// Numerically stable logistic function, result clamped to [0,1]
[[nodiscard]] double sigmoid(double z) noexcept;

/// Score with the linear model
[[nodiscard]] Score score(const features::FeatureVector& fv,
                          const config::WeightConfig& weights);

/**
 * @brief Instantiate the model selected by `config.model`
 * @return InvalidConfig when a decision tree is selected without nodes
 */
[[nodiscard]] qoeguard::Result<std::shared_ptr<const ScoringModel>>
make_model(const config::Config& config);

}  // namespace qoeguard::scoring
