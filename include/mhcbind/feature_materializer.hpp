#pragma once
// Feature materializer: F[r][c] = coeff[X[r][c]]
//
// Substitutes each stored pair index with the current coefficient for that
// pair. Linear in the coefficient vector; its adjoint is
// accumulate_pair_design() in coefficient_engine.hpp.

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

// Throws DimensionMismatch if coeffs.size() != alphabet.num_pairs(),
// IndexOutOfRange if X holds an index >= coeffs.size().
FeatureMatrix materialize_features(const IndexMatrix& X,
                                   const CoefficientVector& coeffs,
                                   const AminoAlphabet& alphabet);

// Same lookup for a single encoded window
Eigen::VectorXd materialize_row(const PairIndex* indices, size_t n, const CoefficientVector& coeffs);

}  // namespace mhcbind
