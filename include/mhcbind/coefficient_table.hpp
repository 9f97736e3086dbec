#pragma once
// Pairwise coefficient tables
//
// Two text layouts are accepted, plain or gzipped, with '#' comments:
//
//   pair list       AC  0.0123        (one "<peptide><mhc> value" per line;
//                   ...                whitespace, tab or comma separated;
//                                      a non-numeric first line is a header)
//
//   square matrix      A     C   ...  (header of K column letters, then
//                   A  0.1  -0.2 ...   one row per peptide letter; entry
//                   C  ...             (row p, column m) is pair (p, m))
//
// Every pair of the alphabet must be present.

#include <map>
#include <string>
#include <vector>

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

enum class TableLayout {
    PairList,
    Matrix
};

// Throws TableLoadError (malformed or missing entries) or UnknownSymbol
CoefficientVector parse_coefficient_lines(const std::vector<std::string>& lines,
                                          const AminoAlphabet& alphabet,
                                          const std::string& source = "<memory>",
                                          TableLayout* detected = nullptr);

CoefficientVector load_coefficient_table(const std::string& path,
                                         const AminoAlphabet& alphabet);

// Dictionary of pair keys to values. Throws TableLoadError if a pair is missing.
CoefficientVector coefficients_from_pairs(const std::map<std::string, double>& pairs,
                                          const AminoAlphabet& alphabet);

// Pair-list layout, in pair-index order
void write_coefficient_table(const std::string& path,
                             const CoefficientVector& coeffs,
                             const AminoAlphabet& alphabet);

}  // namespace mhcbind
