#pragma once
// Trained affinity model: refined pair coefficients plus the linear model
// fitted on them. Saved as plain text so it can be inspected and diffed.
//
//   mhcbind-model 1
//   alphabet ACDEFGHIKLMNPQRSTVWY
//   window_length 9
//   mhc_length 34
//   family ridge-cv
//   intercept <value>
//   weights <n>
//   <n values, one per line>
//   coefficients <K*K>
//   <K*K values, one per line>

#include <cstddef>
#include <string>
#include <string_view>

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/refinement_loop.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

struct AffinityModel {
    AminoAlphabet alphabet;
    size_t window_length = 9;
    size_t mhc_length = 0;
    std::string family;
    double intercept = 0.0;
    PositionWeights weights;          // window_length * mhc_length
    CoefficientVector coefficients;   // alphabet.num_pairs()

    // Predicted IC50 for one window. Throws DimensionMismatch / UnknownSymbol.
    double predict_window(std::string_view window, std::string_view mhc) const;

    // Geometric mean of the window predictions over every offset
    double predict_peptide(std::string_view peptide, std::string_view mhc) const;

    // Throws DimensionMismatch if the parts disagree in size
    void validate() const;
};

// Throws InvalidValue when the refined model has no position weights
AffinityModel make_affinity_model(const AminoAlphabet& alphabet,
                                  size_t window_length,
                                  size_t mhc_length,
                                  const std::string& family,
                                  const RefinementResult& result);

void save_affinity_model(const AffinityModel& model, const std::string& path);

// Throws TableLoadError for malformed files
AffinityModel load_affinity_model(const std::string& path);

}  // namespace mhcbind
