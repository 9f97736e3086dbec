#pragma once
// Model-family capability used by the refinement loop and cross-validation
//
// Every model regresses log(IC50). fit() takes raw affinities and applies the
// log itself; predict() exponentiates back to affinity units. Linear models
// expose their per-position weights so the refinement loop can push them
// back into pair-coefficient space; non-linear models return an empty vector.

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mhcbind/types.hpp"

namespace mhcbind {

class FittedModel {
public:
    virtual ~FittedModel() = default;

    // Predicted log-affinity, one value per row of X
    virtual Eigen::VectorXd predict_log(const FeatureMatrix& X) const = 0;

    // Predicted affinity (exp of predict_log)
    Eigen::VectorXd predict(const FeatureMatrix& X) const;

    // Per-feature weights; empty when the model is not linear
    virtual const PositionWeights& position_weights() const = 0;

    virtual double intercept() const { return 0.0; }

    // Number of feature columns the model was fitted on
    virtual size_t num_features() const = 0;
};

class ModelFamily {
public:
    virtual ~ModelFamily() = default;

    virtual std::string name() const = 0;

    // affinities must be strictly positive; weights non-negative with a positive sum.
    // An empty weight vector means unit weights.
    virtual std::unique_ptr<FittedModel> fit(const FeatureMatrix& X,
                                             const Eigen::VectorXd& affinities,
                                             const Eigen::VectorXd& weights) const = 0;
};

// Families selectable by name: "ridge", "ridge-cv", "ols", "two-stage".
// Throws InvalidValue for an unknown name.
std::unique_ptr<ModelFamily> make_model_family(const std::string& name);

std::vector<std::string> model_family_names();

// Shared fit() preconditions: row counts agree, targets positive, weights valid.
// Returns the weights to use (unit weights when `weights` is empty).
Eigen::VectorXd check_fit_inputs(const FeatureMatrix& X,
                                 const Eigen::VectorXd& affinities,
                                 const Eigen::VectorXd& weights,
                                 const char* context);

}  // namespace mhcbind
