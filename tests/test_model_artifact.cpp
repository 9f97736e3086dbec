// tests/test_model_artifact.cpp
//
// Saved models: window scoring, geometric-mean peptide scoring and the text
// format round trip.

#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/feature_materializer.hpp"
#include "mhcbind/linear_models.hpp"
#include "mhcbind/model_artifact.hpp"
#include "mhcbind/pair_encoder.hpp"
#include "mhcbind/refinement_loop.hpp"
#include "mhcbind/two_stage_model.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
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

bool near(double a, double b, double rel = 1e-12) {
    return std::abs(a - b) <= rel * std::max(1.0, std::abs(b));
}

mhcbind::AffinityModel toy_model() {
    Eigen::VectorXd weights(4), coeffs(4);
    weights << 0.5, -0.25, 1.0, 0.1;
    coeffs << 0.2, -0.1, 0.3, 0.05;
    return mhcbind::AffinityModel{mhcbind::AminoAlphabet("AC"), 2, 2, "ridge", 3.0, weights, coeffs};
}

int test_scoring() {
    std::cout << "[A1] window and peptide scoring\n";
    int failed = 0;
    const auto model = toy_model();

    // "AC" vs "CA" encodes to [2, 0, 3, 1]: features [0.3, 0.2, 0.05, -0.1]
    expect(near(model.predict_window("AC", "CA"), std::exp(3.14)), "single window", failed);
    // "CA" vs "CA" encodes to [3, 1, 2, 0]: features [0.05, -0.1, 0.3, 0.2]
    expect(near(model.predict_window("CA", "CA"), std::exp(3.37)), "second window", failed);
    expect(near(model.predict_peptide("ACA", "CA"), std::exp(0.5 * (3.14 + 3.37))),
           "peptide score is the geometric mean of its windows", failed);
    expect(near(model.predict_peptide("AC", "CA"), model.predict_window("AC", "CA")),
           "one window, one score", failed);

    expect_throws<mhcbind::DimensionMismatch>([&] { (void)model.predict_window("AC", "CAC"); },
                                              "pseudosequence length", failed);
    expect_throws<mhcbind::DimensionMismatch>([&] { (void)model.predict_peptide("A", "CA"); },
                                              "peptide shorter than the window", failed);
    expect_throws<mhcbind::UnknownSymbol>([&] { (void)model.predict_peptide("AXA", "CA"); },
                                          "residue outside the alphabet", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_from_refinement() {
    std::cout << "[A2] model built from a refinement run reproduces its predictions\n";
    int failed = 0;
    const mhcbind::AminoAlphabet alpha("AC");
    const std::string mhc = "CA";
    mhcbind::PairEncoder encoder(alpha, 2);

    std::mt19937_64 rng(3);
    std::uniform_int_distribution<int> letter(0, 1);
    std::uniform_real_distribution<double> ic50(10.0, 5000.0);

    mhcbind::IndexMatrix X;
    std::vector<double> window_weights;
    std::vector<std::string> peptides;
    for (int i = 0; i < 40; ++i) {
        std::string pep = {alpha.letter(static_cast<size_t>(letter(rng))),
                           alpha.letter(static_cast<size_t>(letter(rng)))};
        encoder.append_peptide(pep, mhc, X, window_weights);
        peptides.push_back(pep);
    }
    Eigen::VectorXd Y(40);
    for (Eigen::Index r = 0; r < 40; ++r) Y[r] = ic50(rng);

    Eigen::VectorXd initial(4);
    initial << 0.1, -0.2, 0.3, 0.4;
    mhcbind::RefinementParams params;
    params.n_rounds = 2;
    const mhcbind::RidgeRegression family;
    const auto result = mhcbind::refine_coefficients(X, Y, Eigen::VectorXd(), alpha, family, initial, params);

    const auto model = mhcbind::make_affinity_model(alpha, 2, 2, family.name(), result);
    expect(model.coefficients == result.coefficients, "refined coefficients", failed);
    expect(model.weights == result.model->position_weights(), "fitted weights", failed);

    const Eigen::VectorXd expected = result.model->predict(mhcbind::materialize_features(X, result.coefficients, alpha));
    bool same = true;
    for (size_t r = 0; r < peptides.size(); ++r) {
        if (!near(model.predict_peptide(peptides[r], mhc), expected[static_cast<Eigen::Index>(r)], 1e-10)) {
            same = false;
        }
    }
    expect(same, "artifact scores match the fitted model", failed);

    auto two_stage = mhcbind::TwoStageRegression().fit(
        mhcbind::materialize_features(X, initial, alpha), Y, Eigen::VectorXd());
    mhcbind::RefinementResult non_linear{initial, std::move(two_stage), {}, false};
    expect_throws<mhcbind::InvalidValue>(
        [&] { (void)mhcbind::make_affinity_model(alpha, 2, 2, "two-stage", non_linear); },
        "non-linear models cannot be saved", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_file_format(const std::string& tmpdir) {
    std::cout << "[A3] text format round trip and malformed files\n";
    int failed = 0;
    const auto model = toy_model();
    const std::string path = tmpdir + "/model.txt";

    mhcbind::save_affinity_model(model, path);
    const auto loaded = mhcbind::load_affinity_model(path);
    expect(loaded.alphabet == model.alphabet, "alphabet", failed);
    expect(loaded.window_length == 2 && loaded.mhc_length == 2, "shape", failed);
    expect(loaded.family == "ridge" && loaded.intercept == 3.0, "family and intercept", failed);
    expect(loaded.weights == model.weights && loaded.coefficients == model.coefficients, "exact values", failed);
    expect(loaded.predict_peptide("ACA", "CA") == model.predict_peptide("ACA", "CA"), "same predictions", failed);

    auto write = [&](const std::string& name, const std::string& text) {
        std::ofstream out(tmpdir + "/" + name);
        out << text;
        return tmpdir + "/" + name;
    };

    const std::string header = "mhcbind-model 1\nalphabet AC\nwindow_length 2\nmhc_length 2\nfamily ridge\nintercept 1\n";
    const std::string wrong_tag = write("tag.txt", "some-other-model 1\n");
    const std::string truncated = write("trunc.txt", header + "weights 4\n0.1\n0.2\n");
    const std::string short_weights = write("short.txt", header + "weights 3\n1\n2\n3\ncoefficients 4\n1\n2\n3\n4\n");
    const std::string bad_number = write("nan.txt", header + "weights 4\n1\n2\nx\n4\ncoefficients 4\n1\n2\n3\n4\n");

    expect_throws<mhcbind::TableLoadError>([&] { (void)mhcbind::load_affinity_model(wrong_tag); }, "format tag",
                                           failed);
    expect_throws<mhcbind::TableLoadError>([&] { (void)mhcbind::load_affinity_model(truncated); },
                                           "unexpected end of file", failed);
    expect_throws<mhcbind::TableLoadError>([&] { (void)mhcbind::load_affinity_model(short_weights); },
                                           "weight count disagrees with the shape", failed);
    expect_throws<mhcbind::TableLoadError>([&] { (void)mhcbind::load_affinity_model(bad_number); },
                                           "malformed value", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    char tmp_template[] = "/tmp/mhcbind_model_XXXXXX";
    char* tmp = mkdtemp(tmp_template);
    if (!tmp) {
        std::cerr << "Failed to create temp dir\n";
        return 2;
    }
    const std::string tmpdir = tmp;

    int total = 0;
    total += test_scoring();
    total += test_from_refinement();
    total += test_file_format(tmpdir);

    if (total == 0) {
        std::cout << "\nAll model artifact tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
