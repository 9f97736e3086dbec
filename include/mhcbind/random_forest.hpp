#pragma once
/**
 * @file random_forest.hpp
 * @brief Random forest of CART classification trees
 *
 * First stage of the two-stage affinity model. Trees split on Gini impurity
 * over a random subset of features (sqrt(d) by default) and are grown on
 * bootstrap resamples. Class probabilities are averaged across trees; the
 * predicted class is the arg-max (lowest class wins ties).
 *
 * Each tree draws its seed from the forest seed before any tree is grown, so
 * results do not depend on the OpenMP thread count.
 */

#include <cstdint>
#include <random>
#include <vector>

#include <Eigen/Dense>

#include "mhcbind/types.hpp"

namespace mhcbind {

struct ForestParams {
    uint32_t n_trees = 10;
    uint32_t max_depth = 0;          // 0 = grow until leaves are pure
    uint32_t min_samples_split = 2;
    uint32_t min_samples_leaf = 1;
    uint32_t max_features = 0;       // 0 = floor(sqrt(n_features))
    bool bootstrap = true;
    uint64_t seed = 42;
};

class DecisionTree {
public:
    // weights[i] == 0 excludes sample i (bootstrap miss)
    void fit(const FeatureMatrix& X,
             const std::vector<int>& labels,
             const std::vector<double>& weights,
             int n_classes,
             const ForestParams& params,
             std::mt19937_64& rng);

    // Pointer to n_classes probabilities for row r of X
    const double* predict_proba_row(const FeatureMatrix& X, Eigen::Index r) const;

    size_t num_nodes() const { return nodes_.size(); }
    uint32_t depth() const { return depth_; }

private:
    struct Node {
        int feature = -1;            // -1 for leaves
        double threshold = 0.0;      // go left when x[feature] <= threshold
        int left = -1;
        int right = -1;
        size_t proba_offset = 0;
    };

    int make_leaf(const std::vector<double>& class_weight, double total);

    std::vector<Node> nodes_;
    std::vector<double> proba_;
    int n_classes_ = 0;
    uint32_t depth_ = 0;
};

class RandomForestClassifier {
public:
    explicit RandomForestClassifier(ForestParams params = ForestParams()) : params_(params) {}

    // labels must be >= 0; sample_weight empty = unit weights
    void fit(const FeatureMatrix& X,
             const std::vector<int>& labels,
             const Eigen::VectorXd& sample_weight = Eigen::VectorXd());

    // n_rows x n_classes averaged class probabilities
    Eigen::MatrixXd predict_proba(const FeatureMatrix& X) const;
    std::vector<int> predict(const FeatureMatrix& X) const;

    int num_classes() const { return n_classes_; }
    size_t num_trees() const { return trees_.size(); }
    size_t num_features() const { return n_features_; }
    const ForestParams& params() const { return params_; }

private:
    ForestParams params_;
    std::vector<DecisionTree> trees_;
    int n_classes_ = 0;
    size_t n_features_ = 0;
};

}  // namespace mhcbind
