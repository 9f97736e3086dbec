#pragma once
// Sequence-to-index encoder
//
// Turns a (peptide window, MHC pseudosequence) pair into one pair index per
// (peptide position, MHC position). MHC positions form the inner loop:
//
//   out[i * L + j] = pair_index(window[i], mhc[j])
//
// Peptides longer than the window are slid across every start offset; each
// window gets weight 1/(number of offsets) so long peptides do not dominate
// the loss.

#include <cstddef>
#include <string_view>
#include <vector>

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

class PairEncoder {
public:
    static constexpr size_t DEFAULT_WINDOW = 9;

    // The alphabet must outlive the encoder
    explicit PairEncoder(const AminoAlphabet& alphabet, size_t window_length = DEFAULT_WINDOW);

    const AminoAlphabet& alphabet() const { return alphabet_; }
    size_t window_length() const { return window_length_; }

    // Length of one index vector for a pseudosequence of length mhc_length
    size_t vector_length(size_t mhc_length) const { return window_length_ * mhc_length; }

    // Number of windows a peptide of this length produces (0 if too short)
    size_t num_windows(size_t peptide_length) const {
        return peptide_length < window_length_ ? 0 : peptide_length - window_length_ + 1;
    }

    // Encode one window. Throws DimensionMismatch / UnknownSymbol.
    std::vector<PairIndex> encode(std::string_view window, std::string_view mhc) const;

    // Encode one window into out[0 .. window_length * mhc.size())
    void encode_into(std::string_view window, std::string_view mhc, PairIndex* out) const;

    // Slide the window over the peptide and append one row per offset to X and
    // the matching 1/n weight to weights. X's column count must match. Returns the
    // number of windows appended. Throws DimensionMismatch for short peptides.
    size_t append_peptide(std::string_view peptide,
                          std::string_view mhc,
                          IndexMatrix& X,
                          std::vector<double>& weights) const;

private:
    const AminoAlphabet& alphabet_;
    size_t window_length_;
};

}  // namespace mhcbind
