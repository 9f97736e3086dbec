#include "mhcbind/model_artifact.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/feature_materializer.hpp"
#include "mhcbind/pair_encoder.hpp"
#include "mhcbind/text_reader.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace mhcbind {

namespace {

constexpr const char* kFormatTag = "mhcbind-model";
constexpr int kFormatVersion = 1;

class ArtifactParser {
public:
    explicit ArtifactParser(const std::string& path) : path_(path), lines_(read_lines(path)) {}

    // "<key> <value>" line
    std::string field(const std::string& key) {
        const std::string& line = next();
        std::istringstream iss(line);
        std::string k, v;
        if (!(iss >> k >> v) || k != key) {
            fail("expected '" + key + " <value>'");
        }
        return v;
    }

    size_t count_field(const std::string& key) {
        const std::string v = field(key);
        char* end = nullptr;
        errno = 0;
        const unsigned long long n = std::strtoull(v.c_str(), &end, 10);
        if (end != v.c_str() + v.size() || errno == ERANGE) fail("malformed count '" + v + "'");
        return static_cast<size_t>(n);
    }

    double number(const std::string& text) {
        char* end = nullptr;
        errno = 0;
        const double v = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || errno == ERANGE || text.empty()) {
            fail("malformed number '" + text + "'");
        }
        return v;
    }

    Eigen::VectorXd values(size_t n) {
        Eigen::VectorXd out(static_cast<Eigen::Index>(n));
        for (size_t i = 0; i < n; ++i) out[static_cast<Eigen::Index>(i)] = number(next());
        return out;
    }

    [[noreturn]] void fail(const std::string& msg) const {
        throw TableLoadError(path_ + ":" + std::to_string(pos_) + ": " + msg);
    }

private:
    const std::string& next() {
        if (pos_ >= lines_.size()) {
            ++pos_;
            fail("unexpected end of file");
        }
        return lines_[pos_++];
    }

    std::string path_;
    std::vector<std::string> lines_;
    size_t pos_ = 0;
};

}  // namespace

void AffinityModel::validate() const {
    if (static_cast<size_t>(weights.size()) != window_length * mhc_length) {
        throw DimensionMismatch("Model has " + std::to_string(weights.size()) + " position weights, expected " +
                                std::to_string(window_length * mhc_length));
    }
    if (static_cast<size_t>(coefficients.size()) != alphabet.num_pairs()) {
        throw DimensionMismatch("Model has " + std::to_string(coefficients.size()) + " coefficients, expected " +
                                std::to_string(alphabet.num_pairs()));
    }
}

double AffinityModel::predict_window(std::string_view window, std::string_view mhc) const {
    if (mhc.size() != mhc_length) {
        throw DimensionMismatch("Pseudosequence has length " + std::to_string(mhc.size()) +
                                ", model expects " + std::to_string(mhc_length));
    }
    PairEncoder encoder(alphabet, window_length);
    const std::vector<PairIndex> idx = encoder.encode(window, mhc);
    const Eigen::VectorXd features = materialize_row(idx.data(), idx.size(), coefficients);
    return std::exp(features.dot(weights) + intercept);
}

double AffinityModel::predict_peptide(std::string_view peptide, std::string_view mhc) const {
    PairEncoder encoder(alphabet, window_length);
    const size_t n = encoder.num_windows(peptide.size());
    if (n == 0) {
        throw DimensionMismatch("Peptide '" + std::string(peptide) + "' is shorter than the window length " +
                                std::to_string(window_length));
    }
    double log_sum = 0.0;
    for (size_t s = 0; s < n; ++s) {
        log_sum += std::log(predict_window(peptide.substr(s, window_length), mhc));
    }
    return std::exp(log_sum / static_cast<double>(n));
}

AffinityModel make_affinity_model(const AminoAlphabet& alphabet,
                                  size_t window_length,
                                  size_t mhc_length,
                                  const std::string& family,
                                  const RefinementResult& result) {
    if (!result.model || result.model->position_weights().size() == 0) {
        throw InvalidValue("Model family '" + family + "' has no position weights to save");
    }
    AffinityModel m{alphabet, window_length, mhc_length, family, result.model->intercept(),
                    result.model->position_weights(), result.coefficients};
    m.validate();
    return m;
}

void save_affinity_model(const AffinityModel& model, const std::string& path) {
    model.validate();
    std::ofstream out(path);
    if (!out) {
        throw Error("Cannot open output file: " + path);
    }
    out << kFormatTag << ' ' << kFormatVersion << '\n';
    out << "alphabet " << model.alphabet.letters() << '\n';
    out << "window_length " << model.window_length << '\n';
    out << "mhc_length " << model.mhc_length << '\n';
    out << "family " << model.family << '\n';
    out << std::setprecision(17);
    out << "intercept " << model.intercept << '\n';
    out << "weights " << model.weights.size() << '\n';
    for (Eigen::Index i = 0; i < model.weights.size(); ++i) out << model.weights[i] << '\n';
    out << "coefficients " << model.coefficients.size() << '\n';
    for (Eigen::Index i = 0; i < model.coefficients.size(); ++i) out << model.coefficients[i] << '\n';
    if (!out) {
        throw Error("Write failed: " + path);
    }
}

AffinityModel load_affinity_model(const std::string& path) {
    ArtifactParser p(path);

    if (p.field(kFormatTag) != std::to_string(kFormatVersion)) {
        p.fail("unsupported model format version");
    }
    AffinityModel m{AminoAlphabet(p.field("alphabet")), 0, 0, {}, 0.0, {}, {}};
    m.window_length = p.count_field("window_length");
    m.mhc_length = p.count_field("mhc_length");
    m.family = p.field("family");
    m.intercept = p.number(p.field("intercept"));
    m.weights = p.values(p.count_field("weights"));
    m.coefficients = p.values(p.count_field("coefficients"));

    try {
        m.validate();
    } catch (const DimensionMismatch& e) {
        throw TableLoadError(path + ": " + e.what());
    }
    return m;
}

}  // namespace mhcbind
