#include "mhcbind/pair_encoder.hpp"
#include "mhcbind/errors.hpp"

#include <string>

namespace mhcbind {

PairEncoder::PairEncoder(const AminoAlphabet& alphabet, size_t window_length)
    : alphabet_(alphabet), window_length_(window_length) {
    if (window_length_ == 0) {
        throw DimensionMismatch("Peptide window length must be >= 1");
    }
}

void PairEncoder::encode_into(std::string_view window, std::string_view mhc, PairIndex* out) const {
    if (window.size() != window_length_) {
        throw DimensionMismatch("Peptide window '" + std::string(window) + "' has length " +
                                std::to_string(window.size()) + ", expected " +
                                std::to_string(window_length_));
    }
    if (mhc.empty()) {
        throw DimensionMismatch("Empty MHC pseudosequence");
    }

    const int k = static_cast<int>(alphabet_.size());

    // MHC ranks are reused for every peptide position
    std::vector<int> mhc_rank(mhc.size());
    for (size_t j = 0; j < mhc.size(); ++j) {
        const int r = alphabet_.letter_rank_or_negative(mhc[j]);
        if (r < 0) throw UnknownSymbol(mhc[j], "MHC pseudosequence " + std::string(mhc));
        mhc_rank[j] = r * k;
    }

    size_t pos = 0;
    for (size_t i = 0; i < window_length_; ++i) {
        const int p = alphabet_.letter_rank_or_negative(window[i]);
        if (p < 0) throw UnknownSymbol(window[i], "peptide " + std::string(window));
        for (size_t j = 0; j < mhc.size(); ++j) {
            out[pos++] = static_cast<PairIndex>(mhc_rank[j] + p);
        }
    }
}

std::vector<PairIndex> PairEncoder::encode(std::string_view window, std::string_view mhc) const {
    std::vector<PairIndex> out(vector_length(mhc.size()));
    encode_into(window, mhc, out.data());
    return out;
}

size_t PairEncoder::append_peptide(std::string_view peptide,
                                   std::string_view mhc,
                                   IndexMatrix& X,
                                   std::vector<double>& weights) const {
    const size_t n_windows = num_windows(peptide.size());
    if (n_windows == 0) {
        throw DimensionMismatch("Peptide '" + std::string(peptide) + "' is shorter than the " +
                                std::to_string(window_length_) + "-residue window");
    }
    const size_t d = vector_length(mhc.size());
    if (X.rows() > 0 && X.cols() != d) {
        throw DimensionMismatch("MHC pseudosequence length " + std::to_string(mhc.size()) +
                                " gives " + std::to_string(d) + " columns, batch has " +
                                std::to_string(X.cols()));
    }

    // Encode every window before touching X so a bad symbol leaves it unchanged
    std::vector<PairIndex> rows(n_windows * d);
    for (size_t start = 0; start < n_windows; ++start) {
        encode_into(peptide.substr(start, window_length_), mhc, rows.data() + start * d);
    }

    const double weight = 1.0 / static_cast<double>(n_windows);
    for (size_t start = 0; start < n_windows; ++start) {
        X.append_row(rows.data() + start * d, d);
        weights.push_back(weight);
    }
    return n_windows;
}

}  // namespace mhcbind
