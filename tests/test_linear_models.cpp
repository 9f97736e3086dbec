// tests/test_linear_models.cpp
//
// Weighted ridge, leave-one-out ridge and least squares against closed forms,
// plus the model-family factory.

#include "mhcbind/errors.hpp"
#include "mhcbind/linear_models.hpp"
#include "mhcbind/regression_model.hpp"

#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

template <typename E, typename Fn>
void expect_throws(Fn&& fn, const std::string& msg, int& failed) {
    try {
        fn();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::cerr << "  FAIL: " << msg << " (wrong exception: " << e.what() << ")\n";
        ++failed;
        return;
    }
    std::cerr << "  FAIL: " << msg << " (no exception)\n";
    ++failed;
}

bool near(double a, double b, double tol = 1e-10) {
    return std::abs(a - b) <= tol;
}

Eigen::MatrixXd random_matrix(Eigen::Index n, Eigen::Index p, std::mt19937_64& rng) {
    std::normal_distribution<double> g(0.0, 1.0);
    Eigen::MatrixXd M(n, p);
    for (Eigen::Index i = 0; i < n; ++i)
        for (Eigen::Index j = 0; j < p; ++j) M(i, j) = g(rng);
    return M;
}

int test_ridge_closed_form() {
    std::cout << "[L1] ridge matches the one-feature closed form\n";
    int failed = 0;

    Eigen::MatrixXd X(3, 1);
    X << 1.0, 2.0, 3.0;
    Eigen::VectorXd affinity(3);
    affinity << std::exp(1.0), std::exp(2.0), std::exp(3.0);

    // centered x = y = [-1, 0, 1]: coef = 2 / (2 + 1), intercept = 2 - 2 * coef
    mhcbind::RidgeRegression ridge;
    const auto model = ridge.fit(X, affinity, Eigen::VectorXd());
    expect(near(model->position_weights()[0], 2.0 / 3.0), "coef == 2/3", failed);
    expect(near(model->intercept(), 2.0 / 3.0), "intercept == 2/3", failed);

    const Eigen::VectorXd log_pred = model->predict_log(X);
    expect(near(log_pred[1], 2.0), "prediction at the mean is the mean", failed);
    expect(near(model->predict(X)[2], std::exp(log_pred[2])), "predict == exp(predict_log)", failed);

    mhcbind::RidgeParams no_intercept;
    no_intercept.fit_intercept = false;
    const auto sol = mhcbind::solve_ridge(X, Eigen::Vector3d(1.0, 2.0, 3.0), Eigen::VectorXd(), no_intercept);
    expect(near(sol.coef[0], 14.0 / 15.0) && sol.intercept == 0.0, "no-intercept coef == 14/15", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_weights_as_replication() {
    std::cout << "[L2] integer weights equal replicated rows\n";
    int failed = 0;
    std::mt19937_64 rng(5);

    const Eigen::MatrixXd X = random_matrix(20, 4, rng);
    const Eigen::VectorXd y = random_matrix(20, 1, rng).col(0);
    Eigen::VectorXd w = Eigen::VectorXd::Ones(20);
    w[0] = 3.0;
    w[7] = 2.0;

    Eigen::MatrixXd Xr(23, 4);
    Eigen::VectorXd yr(23);
    Xr.topRows(20) = X;
    yr.head(20) = y;
    Xr.row(20) = X.row(0); yr[20] = y[0];
    Xr.row(21) = X.row(0); yr[21] = y[0];
    Xr.row(22) = X.row(7); yr[22] = y[7];

    const auto a = mhcbind::solve_ridge(X, y, w, {});
    const auto b = mhcbind::solve_ridge(Xr, yr, Eigen::VectorXd(), {});
    expect((a.coef - b.coef).cwiseAbs().maxCoeff() < 1e-10 && near(a.intercept, b.intercept),
           "weighted ridge == replicated ridge", failed);

    const auto c = mhcbind::solve_least_squares(X, y, w);
    const auto d = mhcbind::solve_least_squares(Xr, yr, Eigen::VectorXd());
    expect((c.coef - d.coef).cwiseAbs().maxCoeff() < 1e-10 && near(c.intercept, d.intercept),
           "weighted OLS == replicated OLS", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_ridge_cv() {
    std::cout << "[L3] ridge-cv leave-one-out selection\n";
    int failed = 0;
    std::mt19937_64 rng(9);

    const Eigen::MatrixXd X = random_matrix(60, 5, rng);
    Eigen::VectorXd beta(5);
    beta << 0.5, -1.0, 0.25, 2.0, -0.75;
    const Eigen::VectorXd y = ((X * beta).array() + 1.5).matrix();

    const auto sol = mhcbind::solve_ridge_cv(X, y, Eigen::VectorXd(), {});
    expect(sol.alpha == 0.1, "noiseless data selects the smallest alpha", failed);
    expect(sol.loo_errors.size() == 3, "one LOO error per candidate", failed);
    expect(sol.loo_errors[0] < sol.loo_errors[1] && sol.loo_errors[1] < sol.loo_errors[2],
           "LOO error grows with alpha on noiseless data", failed);

    const auto direct = mhcbind::solve_ridge(X, y, Eigen::VectorXd(), {0.1, true});
    expect((sol.coef - direct.coef).cwiseAbs().maxCoeff() < 1e-8, "refit equals ridge at chosen alpha", failed);

    // Brute-force LOO for one alpha
    double brute = 0.0;
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        std::vector<Eigen::Index> keep;
        for (Eigen::Index j = 0; j < X.rows(); ++j) if (j != i) keep.push_back(j);
        const Eigen::MatrixXd Xi = X(keep, Eigen::all);
        const Eigen::VectorXd yi = y(keep);
        const auto s = mhcbind::solve_ridge(Xi, yi, Eigen::VectorXd(), {1.0, true});
        const double r = y[i] - (X.row(i).dot(s.coef) + s.intercept);
        brute += r * r;
    }
    brute /= static_cast<double>(X.rows());
    expect(std::abs(brute - sol.loo_errors[1]) <= 1e-8 * std::max(1.0, brute),
           "efficient LOO error matches brute force at alpha 1", failed);

    mhcbind::RidgeCVRegression family;
    const auto model = family.fit(X, y.array().exp().matrix(), Eigen::VectorXd());
    const auto* linear = dynamic_cast<const mhcbind::LinearModel*>(model.get());
    expect(linear && linear->alpha() == 0.1, "family reports the chosen alpha", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_least_squares() {
    std::cout << "[L4] least squares\n";
    int failed = 0;
    std::mt19937_64 rng(21);

    const Eigen::MatrixXd X = random_matrix(30, 3, rng);
    const Eigen::VectorXd y = ((X * Eigen::Vector3d(1.0, -2.0, 0.5)).array() - 0.25).matrix();
    const auto sol = mhcbind::solve_least_squares(X, y, Eigen::VectorXd());
    expect((sol.coef - Eigen::Vector3d(1.0, -2.0, 0.5)).cwiseAbs().maxCoeff() < 1e-10,
           "exact recovery of coefficients", failed);
    expect(near(sol.intercept, -0.25), "exact recovery of intercept", failed);

    Eigen::MatrixXd dup(30, 4);
    dup.leftCols(3) = X;
    dup.col(3) = X.col(1);
    expect_throws<mhcbind::NumericalFailure>(
        [&] { (void)mhcbind::solve_least_squares(dup, y, Eigen::VectorXd()); },
        "duplicate column is rank deficient", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_input_errors() {
    std::cout << "[L5] fit input validation and factory\n";
    int failed = 0;
    std::mt19937_64 rng(1);
    const Eigen::MatrixXd X = random_matrix(10, 2, rng);
    const Eigen::VectorXd aff = Eigen::VectorXd::Constant(10, 100.0);

    mhcbind::RidgeRegression ridge;
    Eigen::VectorXd neg = Eigen::VectorXd::Ones(10);
    neg[4] = -1.0;
    expect_throws<mhcbind::InvalidValue>([&] { (void)ridge.fit(X, aff, neg); }, "negative weight", failed);
    expect_throws<mhcbind::InvalidValue>([&] { (void)ridge.fit(X, aff, Eigen::VectorXd::Zero(10)); },
                                         "zero weight sum", failed);

    Eigen::VectorXd bad_aff = aff;
    bad_aff[2] = -5.0;
    expect_throws<mhcbind::InvalidValue>([&] { (void)ridge.fit(X, bad_aff, Eigen::VectorXd()); },
                                         "negative affinity", failed);
    expect_throws<mhcbind::DimensionMismatch>([&] { (void)ridge.fit(X, aff.head(9), Eigen::VectorXd()); },
                                              "target count mismatch", failed);
    expect_throws<mhcbind::InvalidValue>(
        [&] { (void)mhcbind::solve_ridge(X, aff, Eigen::VectorXd(), {0.0, true}); }, "alpha 0", failed);

    const auto model = ridge.fit(X, aff, Eigen::VectorXd());
    expect_throws<mhcbind::DimensionMismatch>(
        [&] { (void)model->predict_log(Eigen::MatrixXd::Zero(3, 5)); }, "predict with wrong width", failed);

    for (const auto& name : mhcbind::model_family_names()) {
        expect(mhcbind::make_model_family(name)->name() == name, "factory builds " + name, failed);
    }
    expect_throws<mhcbind::InvalidValue>([] { (void)mhcbind::make_model_family("svm"); },
                                         "unknown family name", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_ridge_closed_form();
    total += test_weights_as_replication();
    total += test_ridge_cv();
    total += test_least_squares();
    total += test_input_errors();

    if (total == 0) {
        std::cout << "\nAll linear model tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
