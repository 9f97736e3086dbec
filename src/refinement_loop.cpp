#include "mhcbind/refinement_loop.hpp"
#include "mhcbind/coefficient_engine.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/feature_materializer.hpp"

#include <algorithm>
#include <cmath>

namespace mhcbind {

const char* refinement_state_name(RefinementState state) {
    switch (state) {
        case RefinementState::Init: return "Init";
        case RefinementState::FitModel: return "FitModel";
        case RefinementState::ReestimateCoefficients: return "ReestimateCoefficients";
        case RefinementState::Done: return "Done";
    }
    return "Unknown";
}

RefinementLoop::RefinementLoop(const IndexMatrix& X,
                               const Eigen::VectorXd& affinities,
                               const Eigen::VectorXd& weights,
                               const AminoAlphabet& alphabet,
                               const ModelFamily& family,
                               CoefficientVector initial,
                               RefinementParams params)
    : X_(X),
      affinities_(affinities),
      weights_(weights),
      alphabet_(alphabet),
      family_(family),
      params_(params),
      current_(std::make_shared<const CoefficientVector>(std::move(initial))) {}

std::shared_ptr<const FittedModel> RefinementLoop::model() const {
    if (rounds_.empty()) return nullptr;
    return rounds_.back().model;
}

void RefinementLoop::validate_inputs() const {
    if (params_.n_rounds == 0) {
        throw InvalidValue("Refinement needs at least one round");
    }
    if (params_.tol < 0.0 || !std::isfinite(params_.tol)) {
        throw InvalidValue("Refinement tolerance must be finite and >= 0");
    }
    if (static_cast<size_t>(current_->size()) != alphabet_.num_pairs()) {
        throw DimensionMismatch("Initial coefficient vector has " + std::to_string(current_->size()) +
                                " entries, expected " + std::to_string(alphabet_.num_pairs()));
    }
    if (static_cast<size_t>(affinities_.size()) != X_.rows()) {
        throw DimensionMismatch("Refinement: " + std::to_string(X_.rows()) + " rows but " +
                                std::to_string(affinities_.size()) + " targets");
    }
    if (weights_.size() != 0 && static_cast<size_t>(weights_.size()) != X_.rows()) {
        throw DimensionMismatch("Refinement: " + std::to_string(X_.rows()) + " rows but " +
                                std::to_string(weights_.size()) + " sample weights");
    }
    check_positive_targets(affinities_, "refinement");
}

void RefinementLoop::fit_model() {
    const FeatureMatrix F = materialize_features(X_, *current_, alphabet_);

    RefinementRound round;
    round.round = static_cast<uint32_t>(rounds_.size());
    round.coefficients = current_;
    round.model = std::shared_ptr<const FittedModel>(family_.fit(F, affinities_, weights_));
    round.coefficient_change = pending_change_;
    rounds_.push_back(std::move(round));

    if (callback_) callback_(rounds_.back());
}

void RefinementLoop::reestimate() {
    const PositionWeights& w = rounds_.back().position_weights();
    if (w.size() == 0) {
        throw DimensionMismatch("Model family '" + family_.name() +
                                "' exposes no position weights; refinement needs a linear model "
                                "or a single round");
    }

    auto next = std::make_shared<const CoefficientVector>(
        reestimate_coefficients(X_, w, affinities_, alphabet_, params_.reestimate));

    const double base = current_->norm();
    pending_change_ = (*next - *current_).norm() / std::max(base, 1e-300);
    if (params_.tol > 0.0 && pending_change_ < params_.tol) {
        converged_ = true;
    }
    current_ = std::move(next);
}

RefinementState RefinementLoop::step() {
    switch (state_) {
        case RefinementState::Init:
            validate_inputs();
            state_ = RefinementState::FitModel;
            break;

        case RefinementState::FitModel:
            fit_model();
            if (rounds_.size() >= params_.n_rounds || converged_) {
                state_ = RefinementState::Done;
            } else {
                state_ = RefinementState::ReestimateCoefficients;
            }
            break;

        case RefinementState::ReestimateCoefficients:
            reestimate();
            state_ = RefinementState::FitModel;
            break;

        case RefinementState::Done:
            break;
    }
    return state_;
}

void RefinementLoop::run(const RefinementCallback& cb) {
    if (cb) callback_ = cb;
    while (step() != RefinementState::Done) {
    }
}

RefinementResult refine_coefficients(const IndexMatrix& X,
                                     const Eigen::VectorXd& affinities,
                                     const Eigen::VectorXd& weights,
                                     const AminoAlphabet& alphabet,
                                     const ModelFamily& family,
                                     const CoefficientVector& initial,
                                     const RefinementParams& params,
                                     const RefinementCallback& cb) {
    RefinementLoop loop(X, affinities, weights, alphabet, family, initial, params);
    loop.run(cb);

    RefinementResult result;
    result.coefficients = loop.coefficients();
    result.model = loop.model();
    result.rounds = loop.rounds();
    result.converged = loop.converged();
    return result;
}

}  // namespace mhcbind
