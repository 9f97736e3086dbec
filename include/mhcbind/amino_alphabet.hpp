#pragma once

/**
 * @file amino_alphabet.hpp
 * @brief Amino acid alphabet and the ordered pair index
 *
 * Letters are kept sorted so the pair layout is identical across runs and
 * serialized coefficient vectors stay compatible. The MHC letter is the major
 * key and the peptide letter the minor key:
 *
 *   pair_index(p, m) = rank(m) * K + rank(p)
 *
 * Lookups go through a dense 256-entry rank table; no hashing.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "mhcbind/types.hpp"

namespace mhcbind {

class AminoAlphabet {
public:
    static constexpr const char* STANDARD_LETTERS = "ACDEFGHIKLMNPQRSTVWY";
    static constexpr size_t STANDARD_SIZE = 20;
    static constexpr size_t STANDARD_PAIRS = STANDARD_SIZE * STANDARD_SIZE;

    // Letters are sorted. Duplicates throw UnknownSymbol, an empty set DimensionMismatch.
    explicit AminoAlphabet(std::string_view letters = STANDARD_LETTERS);

    static const AminoAlphabet& standard();

    size_t size() const { return letters_.size(); }
    size_t num_pairs() const { return letters_.size() * letters_.size(); }
    const std::string& letters() const { return letters_; }

    bool contains(char c) const { return rank_[static_cast<unsigned char>(c)] >= 0; }

    // -1 for symbols outside the alphabet
    int letter_rank_or_negative(char c) const { return rank_[static_cast<unsigned char>(c)]; }

    // Throws UnknownSymbol
    int letter_rank(char c) const;
    char letter(size_t rank) const;

    PairIndex pair_index(char peptide_letter, char mhc_letter) const {
        return static_cast<PairIndex>(letter_rank(mhc_letter) * static_cast<int>(size()) +
                                      letter_rank(peptide_letter));
    }

    // Inverse of pair_index: (peptide letter, MHC letter). Throws IndexOutOfRange.
    std::pair<char, char> index_to_pair(size_t index) const;

    // Two-character key "<peptide><mhc>" as used by coefficient tables
    std::string pair_key(size_t index) const;

    // Index of a two-character key; throws UnknownSymbol / DimensionMismatch
    PairIndex key_to_index(std::string_view key) const;

    // First symbol of `seq` outside the alphabet, or '\0' if there is none
    char first_unknown(std::string_view seq) const;

    bool operator==(const AminoAlphabet& other) const { return letters_ == other.letters_; }
    bool operator!=(const AminoAlphabet& other) const { return !(*this == other); }

private:
    std::string letters_;
    std::array<int16_t, 256> rank_;
};

}  // namespace mhcbind
