#pragma once
// Weighted linear least squares: ridge, ridge with leave-one-out alpha
// selection, and ordinary least squares.
//
// The intercept is never penalized. With fit_intercept the columns and the
// target are centered by their weighted means; the intercept is recovered as
// y_mean - x_mean . coef.

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mhcbind/regression_model.hpp"

namespace mhcbind {

struct RidgeParams {
    double alpha = 1.0;          // L2 penalty on coefficients (must be > 0)
    bool fit_intercept = true;
};

struct RidgeCVParams {
    std::vector<double> alphas = {0.1, 1.0, 10.0};
    bool fit_intercept = true;
};

struct LinearSolution {
    Eigen::VectorXd coef;
    double intercept = 0.0;
    double alpha = 0.0;                 // penalty actually used
    std::vector<double> loo_errors;     // mean squared LOO error per candidate (ridge-cv only)
};

// Solvers work on the raw target (no log transform). Empty w = unit weights.
// Throw DimensionMismatch, InvalidValue or NumericalFailure.
LinearSolution solve_ridge(const Eigen::MatrixXd& X,
                           const Eigen::VectorXd& y,
                           const Eigen::VectorXd& w,
                           const RidgeParams& params);

// Leave-one-out errors come from one eigendecomposition of the Gram matrix:
// with Z = Xs V, the hat-matrix diagonal for penalty a is sum_k Z_ik^2 / (l_k + a).
LinearSolution solve_ridge_cv(const Eigen::MatrixXd& X,
                              const Eigen::VectorXd& y,
                              const Eigen::VectorXd& w,
                              const RidgeCVParams& params);

// Column-pivoting QR; a rank-deficient design is a NumericalFailure
LinearSolution solve_least_squares(const Eigen::MatrixXd& X,
                                   const Eigen::VectorXd& y,
                                   const Eigen::VectorXd& w,
                                   bool fit_intercept = true);

// Fitted linear model in log-affinity space
class LinearModel : public FittedModel {
public:
    LinearModel(PositionWeights weights, double intercept, double alpha = 0.0)
        : weights_(std::move(weights)), intercept_(intercept), alpha_(alpha) {}

    Eigen::VectorXd predict_log(const FeatureMatrix& X) const override;
    const PositionWeights& position_weights() const override { return weights_; }
    double intercept() const override { return intercept_; }
    size_t num_features() const override { return static_cast<size_t>(weights_.size()); }

    double alpha() const { return alpha_; }

private:
    PositionWeights weights_;
    double intercept_;
    double alpha_;
};

class RidgeRegression : public ModelFamily {
public:
    explicit RidgeRegression(RidgeParams params = RidgeParams()) : params_(params) {}

    std::string name() const override { return "ridge"; }
    std::unique_ptr<FittedModel> fit(const FeatureMatrix& X,
                                     const Eigen::VectorXd& affinities,
                                     const Eigen::VectorXd& weights) const override;

private:
    RidgeParams params_;
};

class RidgeCVRegression : public ModelFamily {
public:
    explicit RidgeCVRegression(RidgeCVParams params = RidgeCVParams()) : params_(std::move(params)) {}

    std::string name() const override { return "ridge-cv"; }
    std::unique_ptr<FittedModel> fit(const FeatureMatrix& X,
                                     const Eigen::VectorXd& affinities,
                                     const Eigen::VectorXd& weights) const override;

private:
    RidgeCVParams params_;
};

class LeastSquaresRegression : public ModelFamily {
public:
    explicit LeastSquaresRegression(bool fit_intercept = true) : fit_intercept_(fit_intercept) {}

    std::string name() const override { return "ols"; }
    std::unique_ptr<FittedModel> fit(const FeatureMatrix& X,
                                     const Eigen::VectorXd& affinities,
                                     const Eigen::VectorXd& weights) const override;

private:
    bool fit_intercept_;
};

}  // namespace mhcbind
