// tests/test_coefficient_table.cpp
//
// Pair-list and matrix coefficient tables, plain and gzipped, plus the
// writer used by 'mhcbind train --coeffs-out'.

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/coefficient_table.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/text_reader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <zlib.h>

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

bool write_gz(const std::string& path, const std::string& content) {
    gzFile gz = gzopen(path.c_str(), "wb");
    if (!gz) return false;
    const int n = gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
    return gzclose(gz) == Z_OK && n == static_cast<int>(content.size());
}

Eigen::VectorXd toy_expected() {
    Eigen::VectorXd v(4);
    v << 0.1, 0.2, 0.3, 0.4;   // AA, CA, AC, CC in pair-index order
    return v;
}

int test_layouts() {
    std::cout << "[T1] pair list and matrix layouts agree\n";
    int failed = 0;
    const mhcbind::AminoAlphabet alpha("AC");

    mhcbind::TableLayout layout = mhcbind::TableLayout::Matrix;
    const auto from_list = mhcbind::parse_coefficient_lines(
        {"pair\tcoefficient", "AA\t0.1", "# comment", "CA 0.2", "", "AC,0.3", "CC 0.4  # trailing"},
        alpha, "<list>", &layout);
    expect(layout == mhcbind::TableLayout::PairList, "pair list detected", failed);
    expect(from_list == toy_expected(), "pair list values", failed);

    const auto from_matrix = mhcbind::parse_coefficient_lines(
        {"   A    C", "A  0.1  0.3", "C  0.2  0.4"}, alpha, "<matrix>", &layout);
    expect(layout == mhcbind::TableLayout::Matrix, "matrix detected", failed);
    expect(from_matrix == toy_expected(), "row is the peptide letter, column the MHC letter", failed);

    const auto reordered = mhcbind::parse_coefficient_lines(
        {"C A", "C 0.4 0.2", "A 0.3 0.1"}, alpha, "<matrix>");
    expect(reordered == toy_expected(), "column and row order follow the labels", failed);

    const auto from_map = mhcbind::coefficients_from_pairs(
        {{"AA", 0.1}, {"CA", 0.2}, {"AC", 0.3}, {"CC", 0.4}}, alpha);
    expect(from_map == toy_expected(), "dictionary values", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_errors() {
    std::cout << "[T2] incomplete and malformed tables\n";
    int failed = 0;
    const mhcbind::AminoAlphabet alpha("AC");

    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::parse_coefficient_lines({"AA 0.1", "CA 0.2", "AC 0.3"}, alpha); },
        "missing pair", failed);
    expect_throws<mhcbind::UnknownSymbol>(
        [&] { (void)mhcbind::parse_coefficient_lines({"AA 0.1", "CX 0.2"}, alpha); },
        "letter outside the alphabet", failed);
    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::parse_coefficient_lines({"AA 0.1", "CA abc", "AC 0.3", "CC 0.4"}, alpha); },
        "malformed value", failed);
    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::parse_coefficient_lines({"# only a comment"}, alpha); }, "no entries", failed);
    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::parse_coefficient_lines({"A C", "A 0.1 0.3", "C 0.2"}, alpha); },
        "short matrix row", failed);
    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::parse_coefficient_lines({"AA 0.1", "AC 0.2", "CA 0.3", "CC 0.4", "AC 0.5"}, alpha); },
        "pair listed twice", failed);
    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::parse_coefficient_lines({"A C", "A 0.1 0.2", "A 0.3 0.4", "C 0.5 0.6"}, alpha); },
        "matrix row letter repeated", failed);
    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::parse_coefficient_lines({"A A", "A 0.1 0.2", "C 0.3 0.4"}, alpha); },
        "matrix column letter repeated", failed);
    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::coefficients_from_pairs({{"AA", 1.0}}, alpha); }, "incomplete dictionary", failed);

    try {
        (void)mhcbind::parse_coefficient_lines({"AA 0.1"}, alpha, "tbl");
        expect(false, "missing pairs are listed", failed);
    } catch (const mhcbind::TableLoadError& e) {
        const std::string what = e.what();
        expect(what.find("3 of 4") != std::string::npos && what.find("CA") != std::string::npos,
               "message names the missing pairs: " + what, failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_files(const std::string& tmpdir) {
    std::cout << "[T3] write, reload and gzipped input\n";
    int failed = 0;
    const auto& alpha = mhcbind::AminoAlphabet::standard();

    std::mt19937_64 rng(8);
    std::normal_distribution<double> g(0.0, 1.0);
    Eigen::VectorXd coeffs(400);
    for (Eigen::Index i = 0; i < 400; ++i) coeffs[i] = g(rng);

    const std::string path = tmpdir + "/coeffs.tsv";
    mhcbind::write_coefficient_table(path, coeffs, alpha);
    const auto loaded = mhcbind::load_coefficient_table(path, alpha);
    expect(loaded == coeffs, "written table reloads exactly", failed);

    const auto lines = mhcbind::read_lines(path);
    expect(lines.size() == 401 && lines[0] == "pair\tcoefficient", "header plus one line per pair", failed);
    expect(lines[2].rfind("CA\t", 0) == 0, "second pair is peptide C with MHC A", failed);

    const std::string gz_path = tmpdir + "/toy.txt.gz";
    expect(write_gz(gz_path, "A C\r\nA 0.1 0.3\r\nC 0.2 0.4\r\n"), "write gz fixture", failed);
    const auto toy = mhcbind::load_coefficient_table(gz_path, mhcbind::AminoAlphabet("AC"));
    expect(toy == toy_expected(), "gzipped matrix with CRLF line ends", failed);

    expect_throws<mhcbind::TableLoadError>(
        [&] { (void)mhcbind::load_coefficient_table(tmpdir + "/absent.tsv", alpha); }, "missing file", failed);
    expect_throws<mhcbind::DimensionMismatch>(
        [&] { mhcbind::write_coefficient_table(tmpdir + "/short.tsv", coeffs.head(10), alpha); },
        "short vector", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    char tmp_template[] = "/tmp/mhcbind_coeffs_XXXXXX";
    char* tmp = mkdtemp(tmp_template);
    if (!tmp) {
        std::cerr << "Failed to create temp dir\n";
        return 2;
    }
    const std::string tmpdir = tmp;

    int total = 0;
    total += test_layouts();
    total += test_errors();
    total += test_files(tmpdir);

    if (total == 0) {
        std::cout << "\nAll coefficient table tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
