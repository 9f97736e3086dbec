#include "mhcbind/types.hpp"
#include "mhcbind/errors.hpp"

#include <algorithm>
#include <cmath>

namespace mhcbind {

void IndexMatrix::set_cols(size_t cols) {
    if (cols_ == cols) return;
    if (rows_ != 0) {
        throw DimensionMismatch("Cannot change column count of a non-empty index matrix (" +
                                std::to_string(cols_) + " -> " + std::to_string(cols) + ")");
    }
    cols_ = cols;
}

void IndexMatrix::append_row(const PairIndex* values, size_t n) {
    if (rows_ == 0 && cols_ == 0) cols_ = n;
    if (n != cols_) {
        throw DimensionMismatch("Index vector has length " + std::to_string(n) +
                                ", expected " + std::to_string(cols_));
    }
    data_.insert(data_.end(), values, values + n);
    ++rows_;
}

PairIndex IndexMatrix::max_value() const {
    if (data_.empty()) return 0;
    return *std::max_element(data_.begin(), data_.end());
}

IndexMatrix IndexMatrix::select_rows(const std::vector<size_t>& rows) const {
    IndexMatrix out(rows.size(), cols_);
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i] >= rows_) {
            throw IndexOutOfRange("Row " + std::to_string(rows[i]) + " out of range (" +
                                  std::to_string(rows_) + " rows)");
        }
        std::copy(row(rows[i]), row(rows[i]) + cols_, out.row(i));
    }
    return out;
}

IndexMatrix IndexMatrix::slice_rows(size_t begin, size_t end) const {
    end = std::min(end, rows_);
    begin = std::min(begin, end);
    IndexMatrix out(end - begin, cols_);
    std::copy(row(begin), row(begin) + (end - begin) * cols_, out.data_.begin());
    return out;
}

IndexMatrix IndexMatrix::drop_rows(size_t begin, size_t end) const {
    end = std::min(end, rows_);
    begin = std::min(begin, end);
    IndexMatrix out(rows_ - (end - begin), cols_);
    auto it = std::copy(data_.begin(), data_.begin() + begin * cols_, out.data_.begin());
    std::copy(data_.begin() + end * cols_, data_.end(), it);
    return out;
}

IndexMatrix IndexMatrix::from_data(size_t rows, size_t cols, std::vector<PairIndex> data) {
    if (data.size() != rows * cols) {
        throw DimensionMismatch("Index data has " + std::to_string(data.size()) +
                                " entries, expected " + std::to_string(rows) + " x " +
                                std::to_string(cols));
    }
    IndexMatrix out;
    out.rows_ = rows;
    out.cols_ = cols;
    out.data_ = std::move(data);
    return out;
}

void check_positive_targets(const Eigen::VectorXd& Y, const char* context) {
    for (Eigen::Index i = 0; i < Y.size(); ++i) {
        if (!std::isfinite(Y[i]) || Y[i] <= 0.0) {
            throw InvalidValue(std::string(context) + ": affinity at row " + std::to_string(i) +
                               " is not strictly positive (" + std::to_string(Y[i]) + ")");
        }
    }
}

void check_sample_weights(const Eigen::VectorXd& W, const char* context) {
    double sum = 0.0;
    for (Eigen::Index i = 0; i < W.size(); ++i) {
        if (!std::isfinite(W[i]) || W[i] < 0.0) {
            throw InvalidValue(std::string(context) + ": sample weight at row " + std::to_string(i) +
                               " is negative or non-finite (" + std::to_string(W[i]) + ")");
        }
        sum += W[i];
    }
    if (W.size() > 0 && sum <= 0.0) {
        throw InvalidValue(std::string(context) + ": sample weights sum to zero");
    }
}

void TrainingSet::validate() const {
    const auto n = static_cast<Eigen::Index>(X.rows());
    if (Y.size() != n) {
        throw DimensionMismatch("Training set has " + std::to_string(X.rows()) + " rows but " +
                                std::to_string(Y.size()) + " targets");
    }
    if (W.size() != n) {
        throw DimensionMismatch("Training set has " + std::to_string(X.rows()) + " rows but " +
                                std::to_string(W.size()) + " weights");
    }
    check_positive_targets(Y, "training set");
    check_sample_weights(W, "training set");
}

}  // namespace mhcbind
