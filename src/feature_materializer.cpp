#include "mhcbind/feature_materializer.hpp"
#include "mhcbind/errors.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mhcbind {

FeatureMatrix materialize_features(const IndexMatrix& X,
                                   const CoefficientVector& coeffs,
                                   const AminoAlphabet& alphabet) {
    if (static_cast<size_t>(coeffs.size()) != alphabet.num_pairs()) {
        throw DimensionMismatch("Coefficient vector has " + std::to_string(coeffs.size()) +
                                " entries, expected " + std::to_string(alphabet.num_pairs()));
    }
    if (!X.empty() && static_cast<size_t>(X.max_value()) >= static_cast<size_t>(coeffs.size())) {
        throw IndexOutOfRange("Pair index " + std::to_string(X.max_value()) +
                              " >= coefficient count " + std::to_string(coeffs.size()));
    }

    const size_t n = X.rows();
    const size_t d = X.cols();
    FeatureMatrix F(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(d));
    const double* c = coeffs.data();

    #pragma omp parallel for schedule(static)
    for (size_t r = 0; r < n; ++r) {
        const PairIndex* row = X.row(r);
        for (size_t j = 0; j < d; ++j) {
            F(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(j)) = c[row[j]];
        }
    }
    return F;
}

Eigen::VectorXd materialize_row(const PairIndex* indices, size_t n, const CoefficientVector& coeffs) {
    Eigen::VectorXd out(static_cast<Eigen::Index>(n));
    for (size_t j = 0; j < n; ++j) {
        if (indices[j] >= coeffs.size()) {
            throw IndexOutOfRange("Pair index " + std::to_string(indices[j]) +
                                  " >= coefficient count " + std::to_string(coeffs.size()));
        }
        out[static_cast<Eigen::Index>(j)] = coeffs[indices[j]];
    }
    return out;
}

}  // namespace mhcbind
