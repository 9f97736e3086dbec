#include "mhcbind/regression_model.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/linear_models.hpp"
#include "mhcbind/two_stage_model.hpp"

namespace mhcbind {

Eigen::VectorXd FittedModel::predict(const FeatureMatrix& X) const {
    return predict_log(X).array().exp().matrix();
}

Eigen::VectorXd check_fit_inputs(const FeatureMatrix& X,
                                 const Eigen::VectorXd& affinities,
                                 const Eigen::VectorXd& weights,
                                 const char* context) {
    const Eigen::Index n = X.rows();
    if (affinities.size() != n) {
        throw DimensionMismatch(std::string(context) + ": " + std::to_string(n) + " rows but " +
                                std::to_string(affinities.size()) + " targets");
    }
    if (n == 0) {
        throw DimensionMismatch(std::string(context) + ": no training rows");
    }
    if (weights.size() != 0 && weights.size() != n) {
        throw DimensionMismatch(std::string(context) + ": " + std::to_string(n) + " rows but " +
                                std::to_string(weights.size()) + " sample weights");
    }
    check_positive_targets(affinities, context);

    Eigen::VectorXd w = weights.size() == 0 ? Eigen::VectorXd(Eigen::VectorXd::Ones(n)) : weights;
    check_sample_weights(w, context);
    return w;
}

std::unique_ptr<ModelFamily> make_model_family(const std::string& name) {
    if (name == "ridge") return std::make_unique<RidgeRegression>();
    if (name == "ridge-cv") return std::make_unique<RidgeCVRegression>();
    if (name == "ols") return std::make_unique<LeastSquaresRegression>();
    if (name == "two-stage") return std::make_unique<TwoStageRegression>();

    std::string known;
    for (const auto& n : model_family_names()) {
        if (!known.empty()) known += ", ";
        known += n;
    }
    throw InvalidValue("Unknown model family '" + name + "' (expected one of: " + known + ")");
}

std::vector<std::string> model_family_names() {
    return {"ridge", "ridge-cv", "ols", "two-stage"};
}

}  // namespace mhcbind
