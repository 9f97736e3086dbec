// Two-stage classifier + per-category regressor

#include "mhcbind/two_stage_model.hpp"
#include "mhcbind/errors.hpp"

#include <algorithm>
#include <cmath>

namespace mhcbind {

int affinity_category(double ic50, double base) {
    if (!(ic50 > 0.0) || !std::isfinite(ic50)) {
        throw InvalidValue("affinity category: IC50 must be positive and finite (got " +
                           std::to_string(ic50) + ")");
    }
    if (!(base > 1.0)) {
        throw InvalidValue("affinity category: base must be > 1 (got " + std::to_string(base) + ")");
    }
    const double c = std::floor(std::log(ic50) / std::log(base));
    return c > 0.0 ? static_cast<int>(c) : 0;
}

FittedTwoStage::FittedTwoStage(RandomForestClassifier classifier,
                               std::vector<std::unique_ptr<LinearModel>> regressors,
                               double category_base,
                               size_t n_features)
    : classifier_(std::move(classifier)),
      regressors_(std::move(regressors)),
      category_base_(category_base),
      n_features_(n_features) {}

std::vector<int> FittedTwoStage::predict_categories(const FeatureMatrix& X) const {
    return classifier_.predict(X);
}

const LinearModel& FittedTwoStage::regressor(int category) const {
    if (category < 0 || category >= num_categories()) {
        throw IndexOutOfRange("affinity category " + std::to_string(category) +
                              " outside trained range [0, " + std::to_string(num_categories()) + ")");
    }
    const auto& r = regressors_[static_cast<size_t>(category)];
    if (!r) throw EmptyCategory(category);
    return *r;
}

size_t FittedTwoStage::num_regressors() const {
    return static_cast<size_t>(std::count_if(regressors_.begin(), regressors_.end(),
                                             [](const auto& r) { return r != nullptr; }));
}

Eigen::VectorXd FittedTwoStage::predict_log(const FeatureMatrix& X) const {
    if (static_cast<size_t>(X.cols()) != n_features_) {
        throw DimensionMismatch("Two-stage model expects " + std::to_string(n_features_) +
                                " features, got " + std::to_string(X.cols()));
    }
    const std::vector<int> categories = predict_categories(X);

    std::vector<std::vector<Eigen::Index>> rows_by_category(static_cast<size_t>(num_categories()));
    for (size_t r = 0; r < categories.size(); ++r) {
        const int c = categories[r];
        if (c < 0 || c >= num_categories()) {
            throw IndexOutOfRange("classifier predicted category " + std::to_string(c) +
                                  " outside trained range");
        }
        rows_by_category[static_cast<size_t>(c)].push_back(static_cast<Eigen::Index>(r));
    }

    Eigen::VectorXd out(X.rows());
    for (int c = 0; c < num_categories(); ++c) {
        const auto& rows = rows_by_category[static_cast<size_t>(c)];
        if (rows.empty()) continue;
        const LinearModel& model = regressor(c);
        const FeatureMatrix sub = X(rows, Eigen::all);
        const Eigen::VectorXd pred = model.predict_log(sub);
        for (size_t k = 0; k < rows.size(); ++k) {
            out[rows[k]] = pred[static_cast<Eigen::Index>(k)];
        }
    }
    return out;
}

std::unique_ptr<FittedModel> TwoStageRegression::fit(const FeatureMatrix& X,
                                                     const Eigen::VectorXd& affinities,
                                                     const Eigen::VectorXd& weights) const {
    const Eigen::VectorXd w = check_fit_inputs(X, affinities, weights, "two-stage");

    const Eigen::Index n = X.rows();
    std::vector<int> categories(static_cast<size_t>(n));
    int max_category = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
        categories[static_cast<size_t>(i)] = affinity_category(affinities[i], params_.category_base);
        max_category = std::max(max_category, categories[static_cast<size_t>(i)]);
    }

    RandomForestClassifier classifier(params_.forest);
    classifier.fit(X, categories, w);

    std::vector<std::unique_ptr<LinearModel>> regressors(static_cast<size_t>(max_category) + 1);
    const Eigen::VectorXd log_y = affinities.array().log().matrix();

    for (int c = 0; c <= max_category; ++c) {
        std::vector<Eigen::Index> rows;
        double weight_sum = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (categories[static_cast<size_t>(i)] == c) {
                rows.push_back(i);
                weight_sum += w[i];
            }
        }
        if (rows.empty() || !(weight_sum > 0.0)) continue;

        const Eigen::MatrixXd Xc = X(rows, Eigen::all);
        const Eigen::VectorXd yc = log_y(rows);
        const Eigen::VectorXd wc = w(rows);
        LinearSolution sol = solve_ridge_cv(Xc, yc, wc, params_.regressor);
        regressors[static_cast<size_t>(c)] =
            std::make_unique<LinearModel>(std::move(sol.coef), sol.intercept, sol.alpha);
    }

    return std::make_unique<FittedTwoStage>(std::move(classifier), std::move(regressors),
                                            params_.category_base, static_cast<size_t>(X.cols()));
}

}  // namespace mhcbind
