#include "mhcbind/coefficient_engine.hpp"
#include "mhcbind/errors.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mhcbind {

Eigen::MatrixXd accumulate_pair_design(const IndexMatrix& X,
                                       const PositionWeights& w,
                                       const AminoAlphabet& alphabet) {
    if (static_cast<size_t>(w.size()) != X.cols()) {
        throw DimensionMismatch("Position weights have " + std::to_string(w.size()) +
                                " entries but the index matrix has " + std::to_string(X.cols()) +
                                " columns");
    }
    const size_t num_pairs = alphabet.num_pairs();
    if (!X.empty() && static_cast<size_t>(X.max_value()) >= num_pairs) {
        throw IndexOutOfRange("Pair index " + std::to_string(X.max_value()) +
                              " >= pair count " + std::to_string(num_pairs));
    }

    const size_t n = X.rows();
    const size_t d = X.cols();
    Eigen::MatrixXd C = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n),
                                              static_cast<Eigen::Index>(num_pairs));

    // Each row scatters into its own design row only
    #pragma omp parallel for schedule(static)
    for (size_t r = 0; r < n; ++r) {
        const PairIndex* row = X.row(r);
        const Eigen::Index ri = static_cast<Eigen::Index>(r);
        for (size_t c = 0; c < d; ++c) {
            C(ri, row[c]) += w[static_cast<Eigen::Index>(c)];
        }
    }
    return C;
}

CoefficientVector reestimate_coefficients(const IndexMatrix& X,
                                          const PositionWeights& w,
                                          const Eigen::VectorXd& affinities,
                                          const AminoAlphabet& alphabet,
                                          const RidgeParams& params) {
    if (static_cast<size_t>(affinities.size()) != X.rows()) {
        throw DimensionMismatch("Re-estimation: " + std::to_string(X.rows()) + " rows but " +
                                std::to_string(affinities.size()) + " targets");
    }
    check_positive_targets(affinities, "re-estimation");

    const Eigen::MatrixXd C = accumulate_pair_design(X, w, alphabet);
    const Eigen::VectorXd log_y = affinities.array().log().matrix();

    LinearSolution sol = solve_ridge(C, log_y, Eigen::VectorXd(), params);
    return sol.coef;
}

}  // namespace mhcbind
