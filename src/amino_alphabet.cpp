#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/errors.hpp"

#include <algorithm>
#include <limits>

namespace mhcbind {

AminoAlphabet::AminoAlphabet(std::string_view letters) : letters_(letters) {
    rank_.fill(-1);
    if (letters_.empty()) {
        throw DimensionMismatch("Alphabet must contain at least one letter");
    }
    std::sort(letters_.begin(), letters_.end());
    auto dup = std::adjacent_find(letters_.begin(), letters_.end());
    if (dup != letters_.end()) {
        throw UnknownSymbol(*dup, "alphabet (duplicate letter)");
    }
    if (num_pairs() > static_cast<size_t>(std::numeric_limits<PairIndex>::max()) + 1) {
        throw DimensionMismatch("Alphabet of " + std::to_string(letters_.size()) +
                                " letters does not fit the pair index type");
    }
    for (size_t i = 0; i < letters_.size(); ++i) {
        rank_[static_cast<unsigned char>(letters_[i])] = static_cast<int16_t>(i);
    }
}

const AminoAlphabet& AminoAlphabet::standard() {
    static const AminoAlphabet alphabet(STANDARD_LETTERS);
    return alphabet;
}

int AminoAlphabet::letter_rank(char c) const {
    const int r = rank_[static_cast<unsigned char>(c)];
    if (r < 0) throw UnknownSymbol(c, "");
    return r;
}

char AminoAlphabet::letter(size_t rank) const {
    if (rank >= letters_.size()) {
        throw IndexOutOfRange("Letter rank " + std::to_string(rank) + " >= alphabet size " +
                              std::to_string(letters_.size()));
    }
    return letters_[rank];
}

std::pair<char, char> AminoAlphabet::index_to_pair(size_t index) const {
    if (index >= num_pairs()) {
        throw IndexOutOfRange("Pair index " + std::to_string(index) + " >= " +
                              std::to_string(num_pairs()));
    }
    const size_t k = letters_.size();
    return {letters_[index % k], letters_[index / k]};
}

std::string AminoAlphabet::pair_key(size_t index) const {
    auto [p, m] = index_to_pair(index);
    return std::string{p, m};
}

PairIndex AminoAlphabet::key_to_index(std::string_view key) const {
    if (key.size() != 2) {
        throw DimensionMismatch("Pair key '" + std::string(key) + "' must have 2 letters");
    }
    const int p = rank_[static_cast<unsigned char>(key[0])];
    if (p < 0) throw UnknownSymbol(key[0], "pair key '" + std::string(key) + "'");
    const int m = rank_[static_cast<unsigned char>(key[1])];
    if (m < 0) throw UnknownSymbol(key[1], "pair key '" + std::string(key) + "'");
    return static_cast<PairIndex>(m * static_cast<int>(size()) + p);
}

char AminoAlphabet::first_unknown(std::string_view seq) const {
    for (char c : seq) {
        if (!contains(c)) return c == '\0' ? '?' : c;
    }
    return '\0';
}

}  // namespace mhcbind
