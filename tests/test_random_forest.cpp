// tests/test_random_forest.cpp
//
// Random forest classifier: separable data, probability rows, seeding,
// sample weights and input validation.

#include "mhcbind/errors.hpp"
#include "mhcbind/random_forest.hpp"

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

// Three classes split on feature 0 at -0.5 and 0.5; features 1..3 are noise
void make_bands(size_t n, uint64_t seed, mhcbind::FeatureMatrix& X, std::vector<int>& labels) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> u(-1.5, 1.5);
    X.resize(static_cast<Eigen::Index>(n), 4);
    labels.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const auto r = static_cast<Eigen::Index>(i);
        for (Eigen::Index c = 0; c < 4; ++c) X(r, c) = u(rng);
        labels[i] = X(r, 0) < -0.5 ? 0 : (X(r, 0) < 0.5 ? 1 : 2);
    }
}

int test_separable() {
    std::cout << "[F1] separable bands are learned\n";
    int failed = 0;

    mhcbind::FeatureMatrix X_train, X_test;
    std::vector<int> y_train, y_test;
    make_bands(400, 1, X_train, y_train);
    make_bands(200, 2, X_test, y_test);

    mhcbind::ForestParams params;
    params.n_trees = 25;
    params.max_features = 2;
    mhcbind::RandomForestClassifier forest(params);
    forest.fit(X_train, y_train);

    expect(forest.num_classes() == 3, "three classes", failed);
    expect(forest.num_trees() == 25, "25 trees", failed);

    const std::vector<int> pred = forest.predict(X_test);
    size_t correct = 0;
    for (size_t i = 0; i < pred.size(); ++i) correct += (pred[i] == y_test[i]);
    const double accuracy = static_cast<double>(correct) / static_cast<double>(pred.size());
    expect(accuracy >= 0.9, "held-out accuracy >= 0.9 (got " + std::to_string(accuracy) + ")", failed);

    const std::vector<int> train_pred = forest.predict(X_train);
    size_t train_correct = 0;
    for (size_t i = 0; i < train_pred.size(); ++i) train_correct += (train_pred[i] == y_train[i]);
    expect(train_correct >= 390, "training accuracy is near perfect", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_probabilities() {
    std::cout << "[F2] probability rows and seeding\n";
    int failed = 0;

    mhcbind::FeatureMatrix X;
    std::vector<int> y;
    make_bands(150, 3, X, y);

    mhcbind::ForestParams params;
    params.n_trees = 8;
    params.seed = 1234;
    mhcbind::RandomForestClassifier a(params), b(params);
    a.fit(X, y);
    b.fit(X, y);

    const Eigen::MatrixXd pa = a.predict_proba(X);
    const Eigen::MatrixXd pb = b.predict_proba(X);
    expect(pa.rows() == 150 && pa.cols() == 3, "proba shape", failed);

    bool rows_ok = true;
    for (Eigen::Index r = 0; r < pa.rows(); ++r) {
        if (std::abs(pa.row(r).sum() - 1.0) > 1e-12) rows_ok = false;
        if (pa.row(r).minCoeff() < 0.0 || pa.row(r).maxCoeff() > 1.0) rows_ok = false;
    }
    expect(rows_ok, "each row is a probability distribution", failed);
    expect(pa == pb, "same seed gives identical forests", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_sample_weights() {
    std::cout << "[F3] zero-weight samples never reach a leaf\n";
    int failed = 0;

    mhcbind::FeatureMatrix X;
    std::vector<int> y;
    make_bands(200, 4, X, y);

    Eigen::VectorXd w = Eigen::VectorXd::Ones(200);
    for (size_t i = 0; i < y.size(); ++i) {
        if (y[i] == 2) w[static_cast<Eigen::Index>(i)] = 0.0;
    }

    mhcbind::RandomForestClassifier forest;
    forest.fit(X, y, w);
    expect(forest.num_classes() == 3, "class count comes from labels", failed);

    const Eigen::MatrixXd proba = forest.predict_proba(X);
    expect(proba.col(2).maxCoeff() == 0.0, "class 2 has no probability mass", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_errors() {
    std::cout << "[F4] input validation\n";
    int failed = 0;

    mhcbind::FeatureMatrix X;
    std::vector<int> y;
    make_bands(20, 5, X, y);

    mhcbind::RandomForestClassifier forest;
    expect_throws<mhcbind::InvalidValue>([&] { (void)forest.predict(X); }, "predict before fit", failed);

    std::vector<int> bad = y;
    bad[3] = -1;
    expect_throws<mhcbind::InvalidValue>([&] { forest.fit(X, bad); }, "negative label", failed);

    std::vector<int> short_labels(y.begin(), y.end() - 1);
    expect_throws<mhcbind::DimensionMismatch>([&] { forest.fit(X, short_labels); }, "label count", failed);
    expect_throws<mhcbind::DimensionMismatch>([&] { forest.fit(X, y, Eigen::VectorXd::Ones(7)); },
                                              "weight count", failed);

    mhcbind::ForestParams none;
    none.n_trees = 0;
    mhcbind::RandomForestClassifier empty(none);
    expect_throws<mhcbind::InvalidValue>([&] { empty.fit(X, y); }, "zero trees", failed);

    forest.fit(X, y);
    expect_throws<mhcbind::DimensionMismatch>([&] { (void)forest.predict(Eigen::MatrixXd::Zero(2, 3)); },
                                              "column count at predict", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_separable();
    total += test_probabilities();
    total += test_sample_weights();
    total += test_errors();

    if (total == 0) {
        std::cout << "\nAll random forest tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
