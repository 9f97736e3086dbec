// Weighted ridge / ridge-cv / OLS solvers
//
// All three share the same preprocessing: resolve unit weights, center by
// weighted means when fitting an intercept, then work on the sqrt(w)-scaled
// centered system.

#include "mhcbind/linear_models.hpp"
#include "mhcbind/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mhcbind {

namespace {

struct CenteredSystem {
    Eigen::MatrixXd Xs;        // sqrt(w) * (X - x_mean)
    Eigen::VectorXd ys;        // sqrt(w) * (y - y_mean)
    Eigen::VectorXd x_mean;
    double y_mean = 0.0;
    Eigen::VectorXd w;
    double w_sum = 0.0;
};

CenteredSystem center_system(const Eigen::MatrixXd& X,
                             const Eigen::VectorXd& y,
                             const Eigen::VectorXd& w_in,
                             bool fit_intercept,
                             const char* context) {
    const Eigen::Index n = X.rows();
    if (y.size() != n) {
        throw DimensionMismatch(std::string(context) + ": " + std::to_string(n) + " rows but " +
                                std::to_string(y.size()) + " targets");
    }
    if (n == 0) {
        throw DimensionMismatch(std::string(context) + ": no training rows");
    }
    if (w_in.size() != 0 && w_in.size() != n) {
        throw DimensionMismatch(std::string(context) + ": " + std::to_string(n) + " rows but " +
                                std::to_string(w_in.size()) + " sample weights");
    }

    CenteredSystem s;
    s.w = (w_in.size() == 0) ? Eigen::VectorXd(Eigen::VectorXd::Ones(n)) : w_in;
    check_sample_weights(s.w, context);
    s.w_sum = s.w.sum();

    if (fit_intercept) {
        s.x_mean = (X.transpose() * s.w) / s.w_sum;
        s.y_mean = s.w.dot(y) / s.w_sum;
    } else {
        s.x_mean = Eigen::VectorXd::Zero(X.cols());
        s.y_mean = 0.0;
    }

    const Eigen::VectorXd sqrt_w = s.w.array().sqrt();
    s.Xs = sqrt_w.asDiagonal() * (X.rowwise() - s.x_mean.transpose());
    s.ys = sqrt_w.array() * (y.array() - s.y_mean);
    return s;
}

void check_finite_solution(const Eigen::VectorXd& coef, const char* context) {
    if (!coef.allFinite()) {
        throw NumericalFailure(std::string(context) + ": solution is not finite");
    }
}

Eigen::VectorXd log_targets(const Eigen::VectorXd& affinities) {
    return affinities.array().log().matrix();
}

}  // namespace

LinearSolution solve_ridge(const Eigen::MatrixXd& X,
                           const Eigen::VectorXd& y,
                           const Eigen::VectorXd& w,
                           const RidgeParams& params) {
    if (!(params.alpha > 0.0) || !std::isfinite(params.alpha)) {
        throw InvalidValue("ridge: alpha must be positive (got " + std::to_string(params.alpha) + ")");
    }
    CenteredSystem s = center_system(X, y, w, params.fit_intercept, "ridge");

    const Eigen::Index p = X.cols();
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(p, p);
    A.selfadjointView<Eigen::Lower>().rankUpdate(s.Xs.transpose());
    A.diagonal().array() += params.alpha;
    const Eigen::VectorXd b = s.Xs.transpose() * s.ys;

    Eigen::LDLT<Eigen::MatrixXd> ldlt(A);
    if (ldlt.info() != Eigen::Success) {
        throw NumericalFailure("ridge: normal equations could not be factorized");
    }

    LinearSolution sol;
    sol.coef = ldlt.solve(b);
    if (ldlt.info() != Eigen::Success) {
        throw NumericalFailure("ridge: solve failed");
    }
    check_finite_solution(sol.coef, "ridge");
    sol.intercept = s.y_mean - s.x_mean.dot(sol.coef);
    sol.alpha = params.alpha;
    return sol;
}

LinearSolution solve_ridge_cv(const Eigen::MatrixXd& X,
                              const Eigen::VectorXd& y,
                              const Eigen::VectorXd& w,
                              const RidgeCVParams& params) {
    if (params.alphas.empty()) {
        throw InvalidValue("ridge-cv: no candidate alphas");
    }
    for (double a : params.alphas) {
        if (!(a > 0.0) || !std::isfinite(a)) {
            throw InvalidValue("ridge-cv: alpha must be positive (got " + std::to_string(a) + ")");
        }
    }
    CenteredSystem s = center_system(X, y, w, params.fit_intercept, "ridge-cv");

    const Eigen::Index n = X.rows();
    const Eigen::Index p = X.cols();

    Eigen::MatrixXd G = Eigen::MatrixXd::Zero(p, p);
    G.selfadjointView<Eigen::Lower>().rankUpdate(s.Xs.transpose());
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(G);
    if (eig.info() != Eigen::Success) {
        throw NumericalFailure("ridge-cv: eigendecomposition of the Gram matrix failed");
    }

    const Eigen::VectorXd lambda = eig.eigenvalues().cwiseMax(0.0);
    const Eigen::MatrixXd& V = eig.eigenvectors();
    const Eigen::MatrixXd Z = s.Xs * V;
    const Eigen::VectorXd Zy = Z.transpose() * s.ys;
    const Eigen::MatrixXd Z2 = Z.array().square().matrix();

    // The intercept column sqrt(w)/|sqrt(w)| is orthogonal to the centered
    // design, so its leverage simply adds w_i / sum(w).
    Eigen::VectorXd h0 = Eigen::VectorXd::Zero(n);
    if (params.fit_intercept) h0 = s.w / s.w_sum;

    LinearSolution sol;
    sol.loo_errors.reserve(params.alphas.size());
    double best_err = std::numeric_limits<double>::infinity();
    Eigen::VectorXd best_d;

    for (double alpha : params.alphas) {
        const Eigen::VectorXd d = (lambda.array() + alpha).inverse().matrix();
        const Eigen::VectorXd fitted = Z * d.cwiseProduct(Zy);
        const Eigen::VectorXd h = Z2 * d + h0;
        const Eigen::ArrayXd denom = (1.0 - h.array()).max(1e-12);
        const double err = ((s.ys - fitted).array() / denom).square().sum() / static_cast<double>(n);
        sol.loo_errors.push_back(err);
        if (err < best_err) {
            best_err = err;
            best_d = d;
            sol.alpha = alpha;
        }
    }
    if (!std::isfinite(best_err)) {
        throw NumericalFailure("ridge-cv: leave-one-out errors are not finite");
    }

    sol.coef = V * best_d.cwiseProduct(Zy);
    check_finite_solution(sol.coef, "ridge-cv");
    sol.intercept = s.y_mean - s.x_mean.dot(sol.coef);
    return sol;
}

LinearSolution solve_least_squares(const Eigen::MatrixXd& X,
                                   const Eigen::VectorXd& y,
                                   const Eigen::VectorXd& w,
                                   bool fit_intercept) {
    CenteredSystem s = center_system(X, y, w, fit_intercept, "ols");

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(s.Xs);
    if (qr.rank() < X.cols()) {
        throw NumericalFailure("ols: design matrix is rank deficient (rank " +
                               std::to_string(qr.rank()) + " of " + std::to_string(X.cols()) + ")");
    }

    LinearSolution sol;
    sol.coef = qr.solve(s.ys);
    check_finite_solution(sol.coef, "ols");
    sol.intercept = s.y_mean - s.x_mean.dot(sol.coef);
    return sol;
}

// ---------------------------------------------------------------------------
// Model families
// ---------------------------------------------------------------------------

Eigen::VectorXd LinearModel::predict_log(const FeatureMatrix& X) const {
    if (static_cast<size_t>(X.cols()) != num_features()) {
        throw DimensionMismatch("Linear model expects " + std::to_string(num_features()) +
                                " features, got " + std::to_string(X.cols()));
    }
    return ((X * weights_).array() + intercept_).matrix();
}

std::unique_ptr<FittedModel> RidgeRegression::fit(const FeatureMatrix& X,
                                                  const Eigen::VectorXd& affinities,
                                                  const Eigen::VectorXd& weights) const {
    const Eigen::VectorXd w = check_fit_inputs(X, affinities, weights, "ridge");
    LinearSolution sol = solve_ridge(X, log_targets(affinities), w, params_);
    return std::make_unique<LinearModel>(std::move(sol.coef), sol.intercept, sol.alpha);
}

std::unique_ptr<FittedModel> RidgeCVRegression::fit(const FeatureMatrix& X,
                                                    const Eigen::VectorXd& affinities,
                                                    const Eigen::VectorXd& weights) const {
    const Eigen::VectorXd w = check_fit_inputs(X, affinities, weights, "ridge-cv");
    LinearSolution sol = solve_ridge_cv(X, log_targets(affinities), w, params_);
    return std::make_unique<LinearModel>(std::move(sol.coef), sol.intercept, sol.alpha);
}

std::unique_ptr<FittedModel> LeastSquaresRegression::fit(const FeatureMatrix& X,
                                                         const Eigen::VectorXd& affinities,
                                                         const Eigen::VectorXd& weights) const {
    const Eigen::VectorXd w = check_fit_inputs(X, affinities, weights, "ols");
    LinearSolution sol = solve_least_squares(X, log_targets(affinities), w, fit_intercept_);
    return std::make_unique<LinearModel>(std::move(sol.coef), sol.intercept, 0.0);
}

}  // namespace mhcbind
