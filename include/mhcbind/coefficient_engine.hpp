#pragma once
// Coefficient re-estimation engine
//
// Pushes per-position weights back into pair space and refits the pair
// coefficients:
//
//   C[r][X[r][c]] += w[c]                   (adjoint of materialization)
//   coeff = ridge(C, log Y, alpha = 1.0)    (intercept fitted, then dropped)
//
// Re-estimation is unweighted: sample weights only enter the model fit.

#include <Eigen/Dense>

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/linear_models.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

// n x num_pairs design. Throws DimensionMismatch if w.size() != X.cols(),
// IndexOutOfRange if X holds an index >= num_pairs.
Eigen::MatrixXd accumulate_pair_design(const IndexMatrix& X,
                                       const PositionWeights& w,
                                       const AminoAlphabet& alphabet);

// Throws DimensionMismatch, IndexOutOfRange, InvalidValue (non-positive or
// non-finite affinities) or NumericalFailure.
CoefficientVector reestimate_coefficients(const IndexMatrix& X,
                                          const PositionWeights& w,
                                          const Eigen::VectorXd& affinities,
                                          const AminoAlphabet& alphabet,
                                          const RidgeParams& params = RidgeParams());

}  // namespace mhcbind
