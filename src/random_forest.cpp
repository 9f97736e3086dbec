// Random forest classifier
//
// Split search sorts the node's samples on each candidate feature and sweeps
// the cumulative class weights from the left, evaluating the weighted Gini
// impurity at every boundary between distinct values.

#include "mhcbind/random_forest.hpp"
#include "mhcbind/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mhcbind {

namespace {

inline double gini(const std::vector<double>& class_weight, double total) {
    if (total <= 0.0) return 0.0;
    double sum_sq = 0.0;
    for (double w : class_weight) {
        const double p = w / total;
        sum_sq += p * p;
    }
    return 1.0 - sum_sq;
}

}  // namespace

// ---------------------------------------------------------------------------
// DecisionTree
// ---------------------------------------------------------------------------

int DecisionTree::make_leaf(const std::vector<double>& class_weight, double total) {
    const size_t offset = proba_.size();
    for (int c = 0; c < n_classes_; ++c) {
        proba_.push_back(total > 0.0 ? class_weight[c] / total : 1.0 / n_classes_);
    }
    return static_cast<int>(offset);
}

void DecisionTree::fit(const FeatureMatrix& X,
                       const std::vector<int>& labels,
                       const std::vector<double>& weights,
                       int n_classes,
                       const ForestParams& params,
                       std::mt19937_64& rng) {
    nodes_.clear();
    proba_.clear();
    n_classes_ = n_classes;
    depth_ = 0;

    const size_t d = static_cast<size_t>(X.cols());
    size_t max_features = params.max_features;
    if (max_features == 0) {
        max_features = static_cast<size_t>(std::floor(std::sqrt(static_cast<double>(d))));
    }
    max_features = std::max<size_t>(1, std::min(max_features, d));
    const size_t min_leaf = std::max<uint32_t>(1, params.min_samples_leaf);

    std::vector<Eigen::Index> idx;
    idx.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        if (weights[i] > 0.0) idx.push_back(static_cast<Eigen::Index>(i));
    }

    struct Task {
        int node;
        size_t begin;
        size_t end;
        uint32_t depth;
    };

    std::vector<Task> stack;
    nodes_.emplace_back();
    stack.push_back({0, 0, idx.size(), 0});

    std::vector<size_t> features(d);
    std::iota(features.begin(), features.end(), size_t{0});
    std::vector<std::pair<double, Eigen::Index>> column;
    std::vector<double> class_w(n_classes_), left_w(n_classes_), right_w(n_classes_);

    while (!stack.empty()) {
        const Task task = stack.back();
        stack.pop_back();
        depth_ = std::max(depth_, task.depth);

        std::fill(class_w.begin(), class_w.end(), 0.0);
        double total = 0.0;
        for (size_t k = task.begin; k < task.end; ++k) {
            class_w[labels[idx[k]]] += weights[idx[k]];
            total += weights[idx[k]];
        }
        const size_t n_node = task.end - task.begin;
        const double parent_gini = gini(class_w, total);

        const bool can_split = d > 0 &&
                               n_node >= std::max<uint32_t>(2, params.min_samples_split) &&
                               (params.max_depth == 0 || task.depth < params.max_depth) &&
                               parent_gini > 1e-12;

        int best_feature = -1;
        double best_impurity = parent_gini;
        double best_threshold = 0.0;

        if (can_split) {
            for (size_t fi = 0; fi < max_features; ++fi) {
                std::uniform_int_distribution<size_t> pick(fi, d - 1);
                std::swap(features[fi], features[pick(rng)]);
                const size_t f = features[fi];

                column.clear();
                for (size_t k = task.begin; k < task.end; ++k) {
                    column.emplace_back(X(idx[k], static_cast<Eigen::Index>(f)), idx[k]);
                }
                std::sort(column.begin(), column.end());
                if (column.front().first == column.back().first) continue;

                std::fill(left_w.begin(), left_w.end(), 0.0);
                right_w = class_w;
                double left_total = 0.0;

                for (size_t k = 0; k + 1 < n_node; ++k) {
                    const int c = labels[column[k].second];
                    const double wt = weights[column[k].second];
                    left_w[c] += wt;
                    right_w[c] -= wt;
                    left_total += wt;

                    if (!(column[k].first < column[k + 1].first)) continue;
                    const size_t n_left = k + 1;
                    if (n_left < min_leaf || n_node - n_left < min_leaf) continue;

                    const double right_total = total - left_total;
                    const double impurity = (left_total * gini(left_w, left_total) +
                                             right_total * gini(right_w, right_total)) / total;
                    if (impurity < best_impurity - 1e-12) {
                        best_impurity = impurity;
                        best_feature = static_cast<int>(f);
                        best_threshold = 0.5 * (column[k].first + column[k + 1].first);
                        if (!(best_threshold < column[k + 1].first)) best_threshold = column[k].first;
                    }
                }
            }
        }

        if (best_feature >= 0) {
            auto first = idx.begin() + static_cast<std::ptrdiff_t>(task.begin);
            auto last = idx.begin() + static_cast<std::ptrdiff_t>(task.end);
            auto mid_it = std::partition(first, last, [&](Eigen::Index i) {
                return X(i, best_feature) <= best_threshold;
            });
            const size_t mid = static_cast<size_t>(mid_it - idx.begin());

            if (mid > task.begin && mid < task.end) {
                const int left = static_cast<int>(nodes_.size());
                nodes_.emplace_back();
                const int right = static_cast<int>(nodes_.size());
                nodes_.emplace_back();

                Node& node = nodes_[task.node];
                node.feature = best_feature;
                node.threshold = best_threshold;
                node.left = left;
                node.right = right;

                stack.push_back({right, mid, task.end, task.depth + 1});
                stack.push_back({left, task.begin, mid, task.depth + 1});
                continue;
            }
        }

        nodes_[task.node].proba_offset = static_cast<size_t>(make_leaf(class_w, total));
    }
}

const double* DecisionTree::predict_proba_row(const FeatureMatrix& X, Eigen::Index r) const {
    int node = 0;
    while (nodes_[node].feature >= 0) {
        const Node& n = nodes_[node];
        node = (X(r, n.feature) <= n.threshold) ? n.left : n.right;
    }
    return proba_.data() + nodes_[node].proba_offset;
}

// ---------------------------------------------------------------------------
// RandomForestClassifier
// ---------------------------------------------------------------------------

void RandomForestClassifier::fit(const FeatureMatrix& X,
                                 const std::vector<int>& labels,
                                 const Eigen::VectorXd& sample_weight) {
    const size_t n = static_cast<size_t>(X.rows());
    if (labels.size() != n) {
        throw DimensionMismatch("random forest: " + std::to_string(n) + " rows but " +
                                std::to_string(labels.size()) + " labels");
    }
    if (n == 0) {
        throw DimensionMismatch("random forest: no training rows");
    }
    if (sample_weight.size() != 0 && static_cast<size_t>(sample_weight.size()) != n) {
        throw DimensionMismatch("random forest: " + std::to_string(n) + " rows but " +
                                std::to_string(sample_weight.size()) + " sample weights");
    }
    if (params_.n_trees == 0) {
        throw InvalidValue("random forest: n_trees must be >= 1");
    }
    const Eigen::VectorXd sw = sample_weight.size() == 0 ? Eigen::VectorXd(Eigen::VectorXd::Ones(n)) : sample_weight;
    check_sample_weights(sw, "random forest");

    int max_label = 0;
    for (int label : labels) {
        if (label < 0) {
            throw InvalidValue("random forest: negative class label " + std::to_string(label));
        }
        max_label = std::max(max_label, label);
    }
    n_classes_ = max_label + 1;
    n_features_ = static_cast<size_t>(X.cols());

    std::mt19937_64 rng(params_.seed);
    std::vector<uint64_t> seeds(params_.n_trees);
    for (auto& s : seeds) s = rng();

    trees_.assign(params_.n_trees, DecisionTree());

    #pragma omp parallel for schedule(dynamic, 1)
    for (size_t t = 0; t < seeds.size(); ++t) {
        std::mt19937_64 tree_rng(seeds[t]);
        std::vector<double> w(n);
        if (params_.bootstrap) {
            std::uniform_int_distribution<size_t> draw(0, n - 1);
            std::vector<uint32_t> counts(n, 0);
            for (size_t i = 0; i < n; ++i) counts[draw(tree_rng)]++;
            for (size_t i = 0; i < n; ++i) w[i] = counts[i] * sw[static_cast<Eigen::Index>(i)];
        } else {
            for (size_t i = 0; i < n; ++i) w[i] = sw[static_cast<Eigen::Index>(i)];
        }
        trees_[t].fit(X, labels, w, n_classes_, params_, tree_rng);
    }
}

Eigen::MatrixXd RandomForestClassifier::predict_proba(const FeatureMatrix& X) const {
    if (trees_.empty()) {
        throw InvalidValue("random forest: predict called before fit");
    }
    if (static_cast<size_t>(X.cols()) != n_features_) {
        throw DimensionMismatch("random forest expects " + std::to_string(n_features_) +
                                " features, got " + std::to_string(X.cols()));
    }

    const Eigen::Index n = X.rows();
    Eigen::MatrixXd proba = Eigen::MatrixXd::Zero(n, n_classes_);
    const double inv_trees = 1.0 / static_cast<double>(trees_.size());

    #pragma omp parallel for schedule(static)
    for (Eigen::Index r = 0; r < n; ++r) {
        for (const auto& tree : trees_) {
            const double* p = tree.predict_proba_row(X, r);
            for (int c = 0; c < n_classes_; ++c) proba(r, c) += p[c];
        }
        proba.row(r) *= inv_trees;
    }
    return proba;
}

std::vector<int> RandomForestClassifier::predict(const FeatureMatrix& X) const {
    const Eigen::MatrixXd proba = predict_proba(X);
    std::vector<int> out(static_cast<size_t>(proba.rows()));
    for (Eigen::Index r = 0; r < proba.rows(); ++r) {
        Eigen::Index best = 0;
        proba.row(r).maxCoeff(&best);
        out[static_cast<size_t>(r)] = static_cast<int>(best);
    }
    return out;
}

}  // namespace mhcbind
