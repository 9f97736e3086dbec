#pragma once
/**
 * @file refinement_loop.hpp
 * @brief Alternating refinement of pair coefficients and position weights
 *
 * State machine:
 *
 *   Init -> FitModel -> ReestimateCoefficients -> FitModel -> ... -> Done
 *
 * FitModel materializes features with the current coefficients and fits the
 * model family on them. ReestimateCoefficients feeds the fitted position
 * weights to the re-estimation engine; the result replaces the current
 * coefficients. Re-estimation is skipped after the last fit, so the final
 * model is always fitted on the final coefficients.
 *
 * Every fit produces an immutable RefinementRound snapshot. Callers may keep
 * snapshots after the loop is gone.
 */

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <vector>

#include <Eigen/Dense>

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/linear_models.hpp"
#include "mhcbind/regression_model.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

enum class RefinementState {
    Init,
    FitModel,
    ReestimateCoefficients,
    Done
};

const char* refinement_state_name(RefinementState state);

struct RefinementParams {
    uint32_t n_rounds = 5;      // number of model fits
    double tol = 0.0;           // stop when relative coefficient change < tol (0 = never)
    RidgeParams reestimate;     // penalty for coefficient re-estimation
};

struct RefinementRound {
    uint32_t round = 0;
    std::shared_ptr<const CoefficientVector> coefficients;   // coefficients the model was fitted on
    std::shared_ptr<const FittedModel> model;
    // ||coeff_round - coeff_{round-1}|| / ||coeff_{round-1}||, NaN for round 0
    double coefficient_change = std::numeric_limits<double>::quiet_NaN();

    const PositionWeights& position_weights() const { return model->position_weights(); }
    double intercept() const { return model->intercept(); }
};

using RefinementCallback = std::function<void(const RefinementRound&)>;

class RefinementLoop {
public:
    // X, affinities, weights, alphabet and family must outlive the loop
    RefinementLoop(const IndexMatrix& X,
                   const Eigen::VectorXd& affinities,
                   const Eigen::VectorXd& weights,
                   const AminoAlphabet& alphabet,
                   const ModelFamily& family,
                   CoefficientVector initial,
                   RefinementParams params = RefinementParams());

    RefinementState state() const { return state_; }

    // Perform one transition and return the new state. No-op once Done.
    RefinementState step();

    // Step until Done; cb runs after every fit
    void run(const RefinementCallback& cb = nullptr);

    // Invoked after every fit performed by step()
    void set_callback(RefinementCallback cb) { callback_ = std::move(cb); }

    const CoefficientVector& coefficients() const { return *current_; }
    std::shared_ptr<const CoefficientVector> coefficients_snapshot() const { return current_; }
    const std::vector<RefinementRound>& rounds() const { return rounds_; }

    // Model fitted on the current coefficients (null before the first fit)
    std::shared_ptr<const FittedModel> model() const;

    bool converged() const { return converged_; }
    const RefinementParams& params() const { return params_; }

private:
    void validate_inputs() const;
    void fit_model();
    void reestimate();

    const IndexMatrix& X_;
    const Eigen::VectorXd& affinities_;
    const Eigen::VectorXd& weights_;
    const AminoAlphabet& alphabet_;
    const ModelFamily& family_;
    RefinementParams params_;

    RefinementState state_ = RefinementState::Init;
    std::shared_ptr<const CoefficientVector> current_;
    double pending_change_ = std::numeric_limits<double>::quiet_NaN();
    std::vector<RefinementRound> rounds_;
    bool converged_ = false;
    RefinementCallback callback_;
};

struct RefinementResult {
    CoefficientVector coefficients;
    std::shared_ptr<const FittedModel> model;
    std::vector<RefinementRound> rounds;
    bool converged = false;
};

// Run the full loop on one training set
RefinementResult refine_coefficients(const IndexMatrix& X,
                                     const Eigen::VectorXd& affinities,
                                     const Eigen::VectorXd& weights,
                                     const AminoAlphabet& alphabet,
                                     const ModelFamily& family,
                                     const CoefficientVector& initial,
                                     const RefinementParams& params = RefinementParams(),
                                     const RefinementCallback& cb = nullptr);

}  // namespace mhcbind
