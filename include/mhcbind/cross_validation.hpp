#pragma once
/**
 * @file cross_validation.hpp
 * @brief Contiguous k-fold evaluation of the refinement loop
 *
 * Fold f tests on rows [f * s, min((f + 1) * s, n)) with s = n / k and trains
 * on every other row, so the n mod k trailing rows are always in training.
 * Each fold restarts from the initial coefficients and runs the full
 * refinement loop on its training rows; every round's model is scored on the
 * held-out rows.
 *
 * A sample is a binder when its IC50 is <= binder_threshold. Metric
 * denominators that are zero yield NaN.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Eigen/Dense>

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/refinement_loop.hpp"
#include "mhcbind/regression_model.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

struct BinaryMetrics {
    double weighted_mae = 0.0;      // sum(w * |pred - actual|) / sum(w)
    double mean_abs_error = 0.0;
    double median_abs_error = 0.0;
    double accuracy = 0.0;          // weighted fraction with matching binder call
    double sensitivity = 0.0;       // among actual binders
    double specificity = 0.0;       // among actual non-binders
    double precision = 0.0;         // among predicted binders
    size_t n = 0;
};

// Throws DimensionMismatch when the three vectors differ in length
BinaryMetrics evaluate_predictions(const Eigen::VectorXd& predicted,
                                   const Eigen::VectorXd& actual,
                                   const Eigen::VectorXd& weights,
                                   double binder_threshold = 500.0);

struct CrossValidationParams {
    uint32_t n_folds = 10;
    double binder_threshold = 500.0;
    RefinementParams refinement;
    bool verbose = false;
};

struct FoldRange {
    size_t test_begin = 0;
    size_t test_end = 0;
};

// Throws InvalidValue for k < 2, DimensionMismatch when n / k == 0
std::vector<FoldRange> contiguous_folds(size_t n, uint32_t k);

struct RoundMetrics {
    uint32_t round = 0;
    double coefficient_change = 0.0;
    BinaryMetrics test;
};

struct FoldResult {
    uint32_t fold = 0;
    size_t train_size = 0;
    size_t test_size = 0;
    double baseline_accuracy = 0.0;   // majority-class binder accuracy on the training rows
    std::vector<RoundMetrics> rounds;

    const BinaryMetrics& final_metrics() const { return rounds.back().test; }
};

struct CrossValidationResult {
    std::vector<FoldResult> folds;
    std::vector<double> mean_error_by_round;   // weighted MAE averaged over folds
    double mean_error = 0.0;                   // final-round weighted MAE averaged over folds
};

// Any failure inside a fold aborts the whole run
CrossValidationResult cross_validate(const TrainingSet& data,
                                     const CoefficientVector& initial,
                                     const AminoAlphabet& alphabet,
                                     const ModelFamily& family,
                                     const CrossValidationParams& params = CrossValidationParams());

// Permute rows of X, Y and W together
void shuffle_training_set(TrainingSet& data, uint64_t seed);

}  // namespace mhcbind
