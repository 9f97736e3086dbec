// tests/test_amino_alphabet.cpp
//
// Pair index bijection and the sequence-to-index layout on the standard
// 20-letter alphabet and a two-letter toy alphabet.

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/errors.hpp"

#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

template <typename E, typename Fn>
void expect_throws(Fn&& fn, const std::string& msg, int& failed) {
    try {
        fn();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::cerr << "  FAIL: " << msg << " (wrong exception: " << e.what() << ")\n";
        ++failed;
        return;
    }
    std::cerr << "  FAIL: " << msg << " (no exception)\n";
    ++failed;
}

int test_standard_bijection() {
    std::cout << "[A1] standard alphabet pair bijection\n";
    int failed = 0;
    const auto& alpha = mhcbind::AminoAlphabet::standard();

    expect(alpha.size() == 20, "standard alphabet has 20 letters", failed);
    expect(alpha.num_pairs() == 400, "standard alphabet has 400 pairs", failed);
    expect(alpha.letters() == "ACDEFGHIKLMNPQRSTVWY", "letters are sorted", failed);

    std::set<size_t> seen;
    for (char a : alpha.letters()) {
        for (char b : alpha.letters()) {
            const size_t idx = alpha.pair_index(a, b);
            expect(idx < 400, std::string("index in range for ") + a + b, failed);
            seen.insert(idx);
            const auto back = alpha.index_to_pair(idx);
            expect(back.first == a && back.second == b,
                   std::string("round trip for ") + a + b, failed);
            expect(alpha.key_to_index(std::string{a, b}) == idx,
                   std::string("key lookup for ") + a + b, failed);
        }
    }
    expect(seen.size() == 400, "400 distinct indices", failed);
    expect(*seen.begin() == 0 && *seen.rbegin() == 399, "indices cover [0, 400)", failed);

    // MHC letter is the major key
    expect(alpha.pair_index('C', 'A') == 1, "pair (C, A) is index 1", failed);
    expect(alpha.pair_index('A', 'C') == 20, "pair (A, C) is index 20", failed);
    expect(alpha.pair_key(20) == "AC", "pair key of index 20", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_toy_alphabet() {
    std::cout << "[A2] two-letter alphabet\n";
    int failed = 0;
    const mhcbind::AminoAlphabet alpha("CA");

    expect(alpha.letters() == "AC", "letters sorted at construction", failed);
    expect(alpha.num_pairs() == 4, "4 pairs", failed);
    expect(alpha.pair_index('A', 'A') == 0, "pi(A,A) == 0", failed);
    expect(alpha.pair_index('C', 'A') == 1, "pi(C,A) == 1", failed);
    expect(alpha.pair_index('A', 'C') == 2, "pi(A,C) == 2", failed);
    expect(alpha.pair_index('C', 'C') == 3, "pi(C,C) == 3", failed);
    expect(alpha.letter_rank('C') == 1, "rank of C", failed);
    expect(alpha != mhcbind::AminoAlphabet::standard(), "differs from standard alphabet", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_alphabet_errors() {
    std::cout << "[A3] alphabet error reporting\n";
    int failed = 0;
    const auto& alpha = mhcbind::AminoAlphabet::standard();

    expect_throws<mhcbind::UnknownSymbol>([&] { (void)alpha.letter_rank('X'); },
                                          "X is not a standard residue", failed);
    expect_throws<mhcbind::UnknownSymbol>([&] { (void)alpha.pair_index('A', 'B'); },
                                          "unknown MHC letter", failed);
    expect_throws<mhcbind::IndexOutOfRange>([&] { (void)alpha.index_to_pair(400); },
                                            "index 400 out of range", failed);
    expect_throws<mhcbind::DimensionMismatch>([&] { (void)alpha.key_to_index("ACD"); },
                                              "three-letter key", failed);
    expect_throws<mhcbind::UnknownSymbol>([&] { mhcbind::AminoAlphabet dup("AAC"); },
                                          "duplicate letters", failed);
    expect_throws<mhcbind::DimensionMismatch>([&] { mhcbind::AminoAlphabet empty(""); },
                                              "empty alphabet", failed);

    try {
        (void)alpha.letter_rank('Z');
    } catch (const mhcbind::UnknownSymbol& e) {
        expect(e.symbol() == 'Z', "exception carries the offending symbol", failed);
    }

    expect(alpha.first_unknown("SIINFEKL") == '\0', "valid peptide has no unknown symbol", failed);
    expect(alpha.first_unknown("SIIXFEKL") == 'X', "first unknown symbol reported", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_standard_bijection();
    total += test_toy_alphabet();
    total += test_alphabet_errors();

    if (total == 0) {
        std::cout << "\nAll alphabet tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
