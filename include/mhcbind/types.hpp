#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace mhcbind {

// Index into the amino acid pair space (400 for the standard alphabet)
using PairIndex = uint16_t;

// Dense real-valued arrays shared by the materializer, engine and models
using FeatureMatrix = Eigen::MatrixXd;       // n_samples x n_positions
using CoefficientVector = Eigen::VectorXd;   // one value per pair index
using PositionWeights = Eigen::VectorXd;     // one value per (peptide, MHC) position pair

// Row-major matrix of pair indices, one row per training sample (the "X" artifact).
// Rows are appended once and never modified afterwards.
class IndexMatrix {
public:
    IndexMatrix() = default;
    IndexMatrix(size_t rows, size_t cols) : rows_(rows), cols_(cols), data_(rows * cols, 0) {}

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return rows_ == 0; }

    const PairIndex* row(size_t r) const { return data_.data() + r * cols_; }
    PairIndex* row(size_t r) { return data_.data() + r * cols_; }

    PairIndex operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }
    PairIndex& operator()(size_t r, size_t c) { return data_[r * cols_ + c]; }

    const std::vector<PairIndex>& data() const { return data_; }

    // Fix the column count of an empty matrix (no-op if it already matches)
    void set_cols(size_t cols);

    // Append one row; the first row fixes the column count.
    // Throws DimensionMismatch if n differs from cols().
    void append_row(const PairIndex* values, size_t n);

    void reserve_rows(size_t rows) { data_.reserve(rows * cols_); }

    // Largest stored index (0 for an empty matrix)
    PairIndex max_value() const;

    // Copy of the given rows, in order
    IndexMatrix select_rows(const std::vector<size_t>& rows) const;

    // Rows [begin, end) and the complement, preserving order
    IndexMatrix slice_rows(size_t begin, size_t end) const;
    IndexMatrix drop_rows(size_t begin, size_t end) const;

    static IndexMatrix from_data(size_t rows, size_t cols, std::vector<PairIndex> data);

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<PairIndex> data_;
};

// Training triple: pair indices, IC50 targets, per-sample weights
struct TrainingSet {
    IndexMatrix X;
    Eigen::VectorXd Y;   // IC50, strictly positive
    Eigen::VectorXd W;   // sample weights, non-negative

    size_t size() const { return X.rows(); }

    // Throws DimensionMismatch / InvalidValue on any violated contract
    void validate() const;
};

// Check that targets are strictly positive and finite (needed for the log transform)
void check_positive_targets(const Eigen::VectorXd& Y, const char* context);

// Check that weights are finite, non-negative and have a positive sum
void check_sample_weights(const Eigen::VectorXd& W, const char* context);

}  // namespace mhcbind
