#pragma once
// Two-stage affinity model: classify into a log-scale affinity category, then
// regress log(IC50) with that category's own ridge model.
//
// category(y) = max(0, floor(log(y) / log(base))), base 50 by default, so the
// categories are IC50 < 2500, < 125000, < 6.25e6 and so on. The same
// discretization is used for training and prediction.

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mhcbind/linear_models.hpp"
#include "mhcbind/random_forest.hpp"
#include "mhcbind/regression_model.hpp"

namespace mhcbind {

struct TwoStageParams {
    double category_base = 50.0;
    ForestParams forest;
    RidgeCVParams regressor;
};

int affinity_category(double ic50, double base = 50.0);

class FittedTwoStage : public FittedModel {
public:
    FittedTwoStage(RandomForestClassifier classifier,
                   std::vector<std::unique_ptr<LinearModel>> regressors,
                   double category_base,
                   size_t n_features);

    Eigen::VectorXd predict_log(const FeatureMatrix& X) const override;
    const PositionWeights& position_weights() const override { return empty_weights_; }
    size_t num_features() const override { return n_features_; }

    std::vector<int> predict_categories(const FeatureMatrix& X) const;

    // Regressor trained on category c.
    // Throws IndexOutOfRange beyond the trained range, EmptyCategory for a gap.
    const LinearModel& regressor(int category) const;

    // Number of categories that received a regressor
    size_t num_regressors() const;
    // One past the highest trained category
    int num_categories() const { return static_cast<int>(regressors_.size()); }

    const RandomForestClassifier& classifier() const { return classifier_; }
    double category_base() const { return category_base_; }

private:
    RandomForestClassifier classifier_;
    std::vector<std::unique_ptr<LinearModel>> regressors_;   // null = no samples
    double category_base_;
    size_t n_features_;
    PositionWeights empty_weights_;
};

class TwoStageRegression : public ModelFamily {
public:
    explicit TwoStageRegression(TwoStageParams params = TwoStageParams()) : params_(std::move(params)) {}

    std::string name() const override { return "two-stage"; }
    std::unique_ptr<FittedModel> fit(const FeatureMatrix& X,
                                     const Eigen::VectorXd& affinities,
                                     const Eigen::VectorXd& weights) const override;

    const TwoStageParams& params() const { return params_; }

private:
    TwoStageParams params_;
};

}  // namespace mhcbind
