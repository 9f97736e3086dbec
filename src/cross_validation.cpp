#include "mhcbind/cross_validation.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/feature_materializer.hpp"
#include "mhcbind/log_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <random>

namespace mhcbind {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

inline double ratio_or_nan(double num, double den) {
    return den > 0.0 ? num / den : kNaN;
}

double median_of(std::vector<double> v) {
    if (v.empty()) return kNaN;
    const size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    const double hi = v[mid];
    if (v.size() % 2 == 1) return hi;
    const double lo = *std::max_element(v.begin(), v.begin() + mid);
    return 0.5 * (lo + hi);
}

// Rows [0, begin) followed by rows [end, n)
Eigen::VectorXd drop_segment(const Eigen::VectorXd& v, size_t begin, size_t end) {
    const Eigen::Index b = static_cast<Eigen::Index>(begin);
    const Eigen::Index e = static_cast<Eigen::Index>(end);
    Eigen::VectorXd out(v.size() - (e - b));
    out.head(b) = v.head(b);
    out.tail(v.size() - e) = v.tail(v.size() - e);
    return out;
}

double binder_baseline(const Eigen::VectorXd& Y, double threshold) {
    if (Y.size() == 0) return kNaN;
    const double frac = (Y.array() <= threshold).cast<double>().mean();
    return std::max(frac, 1.0 - frac);
}

}  // namespace

BinaryMetrics evaluate_predictions(const Eigen::VectorXd& predicted,
                                   const Eigen::VectorXd& actual,
                                   const Eigen::VectorXd& weights,
                                   double binder_threshold) {
    if (predicted.size() != actual.size() || weights.size() != actual.size()) {
        throw DimensionMismatch("evaluate: " + std::to_string(predicted.size()) + " predictions, " +
                                std::to_string(actual.size()) + " targets, " +
                                std::to_string(weights.size()) + " weights");
    }

    BinaryMetrics m;
    m.n = static_cast<size_t>(actual.size());

    double w_total = 0.0, w_abs_err = 0.0, w_correct = 0.0;
    double w_pos = 0.0, w_pos_correct = 0.0;
    double w_neg = 0.0, w_neg_correct = 0.0;
    double w_pred_pos = 0.0, w_pred_pos_correct = 0.0;
    std::vector<double> abs_err(m.n);

    for (Eigen::Index i = 0; i < actual.size(); ++i) {
        const double w = weights[i];
        const double err = std::abs(predicted[i] - actual[i]);
        abs_err[static_cast<size_t>(i)] = err;

        const bool pred_binder = predicted[i] <= binder_threshold;
        const bool actual_binder = actual[i] <= binder_threshold;
        const bool correct = pred_binder == actual_binder;

        w_total += w;
        w_abs_err += w * err;
        if (correct) w_correct += w;
        if (actual_binder) {
            w_pos += w;
            if (correct) w_pos_correct += w;
        } else {
            w_neg += w;
            if (correct) w_neg_correct += w;
        }
        if (pred_binder) {
            w_pred_pos += w;
            if (correct) w_pred_pos_correct += w;
        }
    }

    m.weighted_mae = ratio_or_nan(w_abs_err, w_total);
    m.mean_abs_error = m.n > 0
        ? std::accumulate(abs_err.begin(), abs_err.end(), 0.0) / static_cast<double>(m.n)
        : kNaN;
    m.median_abs_error = median_of(std::move(abs_err));
    m.accuracy = ratio_or_nan(w_correct, w_total);
    m.sensitivity = ratio_or_nan(w_pos_correct, w_pos);
    m.specificity = ratio_or_nan(w_neg_correct, w_neg);
    m.precision = ratio_or_nan(w_pred_pos_correct, w_pred_pos);
    return m;
}

std::vector<FoldRange> contiguous_folds(size_t n, uint32_t k) {
    if (k < 2) {
        throw InvalidValue("Cross-validation needs at least two folds, got " + std::to_string(k));
    }
    const size_t size = n / k;
    if (size == 0) {
        throw DimensionMismatch("Cannot split " + std::to_string(n) + " samples into " +
                                std::to_string(k) + " folds");
    }
    std::vector<FoldRange> folds(k);
    for (uint32_t f = 0; f < k; ++f) {
        folds[f].test_begin = f * size;
        folds[f].test_end = std::min(static_cast<size_t>(f + 1) * size, n);
    }
    return folds;
}

CrossValidationResult cross_validate(const TrainingSet& data,
                                     const CoefficientVector& initial,
                                     const AminoAlphabet& alphabet,
                                     const ModelFamily& family,
                                     const CrossValidationParams& params) {
    data.validate();
    const auto folds = contiguous_folds(data.size(), params.n_folds);
    const auto t_start = std::chrono::steady_clock::now();

    CrossValidationResult result;
    result.folds.reserve(folds.size());

    for (uint32_t f = 0; f < folds.size(); ++f) {
        const auto t_fold = std::chrono::steady_clock::now();
        const size_t begin = folds[f].test_begin;
        const size_t end = folds[f].test_end;

        const IndexMatrix X_train = data.X.drop_rows(begin, end);
        const IndexMatrix X_test = data.X.slice_rows(begin, end);
        const Eigen::VectorXd Y_train = drop_segment(data.Y, begin, end);
        const Eigen::VectorXd W_train = drop_segment(data.W, begin, end);
        const Eigen::VectorXd Y_test = data.Y.segment(static_cast<Eigen::Index>(begin),
                                                      static_cast<Eigen::Index>(end - begin));
        const Eigen::VectorXd W_test = data.W.segment(static_cast<Eigen::Index>(begin),
                                                      static_cast<Eigen::Index>(end - begin));

        FoldResult fold;
        fold.fold = f;
        fold.train_size = X_train.rows();
        fold.test_size = X_test.rows();
        fold.baseline_accuracy = binder_baseline(Y_train, params.binder_threshold);

        if (params.verbose) {
            std::cerr << "Fold " << (f + 1) << "/" << folds.size()
                      << ": train n=" << fold.train_size << ", test n=" << fold.test_size << "\n";
            std::cerr << "  Training baseline accuracy: " << fold.baseline_accuracy << "\n";
        }

        auto score_round = [&](const RefinementRound& round) {
            const FeatureMatrix F_test = materialize_features(X_test, *round.coefficients, alphabet);
            const Eigen::VectorXd pred = round.model->predict(F_test);

            RoundMetrics rm;
            rm.round = round.round;
            rm.coefficient_change = round.coefficient_change;
            rm.test = evaluate_predictions(pred, Y_test, W_test, params.binder_threshold);
            fold.rounds.push_back(rm);

            if (params.verbose) {
                std::cerr << "  Round " << round.round << ": coeff "
                          << log_utils::format_head(*round.coefficients) << "\n";
                std::cerr << "    error " << rm.test.weighted_mae
                          << ", mean " << rm.test.mean_abs_error
                          << ", median " << rm.test.median_abs_error << "\n";
                std::cerr << "    accuracy " << rm.test.accuracy
                          << ", sensitivity " << rm.test.sensitivity
                          << ", specificity " << rm.test.specificity
                          << ", precision " << rm.test.precision << "\n";
            }
        };

        refine_coefficients(X_train, Y_train, W_train, alphabet, family, initial,
                            params.refinement, score_round);

        if (params.verbose) {
            std::cerr << "  Fold time: "
                      << log_utils::format_elapsed(t_fold, std::chrono::steady_clock::now()) << "\n";
        }
        result.folds.push_back(std::move(fold));
    }

    // Folds may stop at different rounds when early stopping is on; average
    // each round over the folds that reached it.
    size_t max_rounds = 0;
    for (const auto& fold : result.folds) max_rounds = std::max(max_rounds, fold.rounds.size());
    result.mean_error_by_round.assign(max_rounds, 0.0);
    std::vector<size_t> reached(max_rounds, 0);
    double final_sum = 0.0;
    for (const auto& fold : result.folds) {
        for (size_t r = 0; r < fold.rounds.size(); ++r) {
            result.mean_error_by_round[r] += fold.rounds[r].test.weighted_mae;
            reached[r]++;
        }
        final_sum += fold.final_metrics().weighted_mae;
    }
    for (size_t r = 0; r < max_rounds; ++r) {
        result.mean_error_by_round[r] /= static_cast<double>(reached[r]);
    }
    result.mean_error = final_sum / static_cast<double>(result.folds.size());

    if (params.verbose) {
        std::cerr << "Overall CV error: " << result.mean_error << " ("
                  << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()) << ")\n";
    }
    return result;
}

void shuffle_training_set(TrainingSet& data, uint64_t seed) {
    data.validate();
    std::vector<size_t> order(data.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::mt19937_64 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    TrainingSet shuffled;
    shuffled.X = data.X.select_rows(order);
    shuffled.Y.resize(data.Y.size());
    shuffled.W.resize(data.W.size());
    for (size_t i = 0; i < order.size(); ++i) {
        shuffled.Y[static_cast<Eigen::Index>(i)] = data.Y[static_cast<Eigen::Index>(order[i])];
        shuffled.W[static_cast<Eigen::Index>(i)] = data.W[static_cast<Eigen::Index>(order[i])];
    }
    data = std::move(shuffled);
}

}  // namespace mhcbind
