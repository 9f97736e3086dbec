#include "mhcbind/coefficient_table.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/text_reader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <string_view>

namespace mhcbind {

namespace {

std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == ',')) ++i;
        const size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != ',') ++i;
        if (i > start) tokens.emplace_back(line.substr(start, i - start));
    }
    return tokens;
}

bool parse_double(const std::string& token, double& value) {
    if (token.empty()) return false;
    errno = 0;
    char* end = nullptr;
    value = std::strtod(token.c_str(), &end);
    return end == token.c_str() + token.size() && errno != ERANGE;
}

struct ContentLine {
    size_t line_number;
    std::vector<std::string> tokens;
};

std::vector<ContentLine> content_lines(const std::vector<std::string>& lines) {
    std::vector<ContentLine> out;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string_view line(lines[i]);
        const size_t hash = line.find('#');
        if (hash != std::string_view::npos) line = line.substr(0, hash);
        auto tokens = tokenize(line);
        if (!tokens.empty()) out.push_back({i + 1, std::move(tokens)});
    }
    return out;
}

bool is_matrix_header(const std::vector<std::string>& tokens, const AminoAlphabet& alphabet) {
    if (tokens.size() != alphabet.size()) return false;
    double ignored = 0.0;
    for (const auto& t : tokens) {
        if (t.size() != 1 || parse_double(t, ignored)) return false;
    }
    return true;
}

std::string where(const std::string& source, size_t line_number) {
    return source + ":" + std::to_string(line_number);
}

void mark_seen(std::vector<bool>& seen, size_t idx, const AminoAlphabet& alphabet,
               const std::string& location) {
    if (seen[idx]) {
        throw TableLoadError(location + ": pair " + alphabet.pair_key(idx) + " given twice");
    }
    seen[idx] = true;
}

void check_complete(const std::vector<bool>& seen, const AminoAlphabet& alphabet,
                    const std::string& source) {
    std::string missing;
    size_t n_missing = 0;
    for (size_t i = 0; i < seen.size(); ++i) {
        if (seen[i]) continue;
        if (n_missing < 8) missing += (n_missing ? " " : "") + alphabet.pair_key(i);
        ++n_missing;
    }
    if (n_missing > 0) {
        throw TableLoadError(source + ": " + std::to_string(n_missing) + " of " +
                             std::to_string(seen.size()) + " pairs missing (" + missing +
                             (n_missing > 8 ? " ..." : "") + ")");
    }
}

}  // namespace

CoefficientVector parse_coefficient_lines(const std::vector<std::string>& lines,
                                          const AminoAlphabet& alphabet,
                                          const std::string& source,
                                          TableLayout* detected) {
    const auto content = content_lines(lines);
    if (content.empty()) {
        throw TableLoadError(source + ": no coefficient entries");
    }

    const size_t K = alphabet.size();
    CoefficientVector coeffs = CoefficientVector::Zero(static_cast<Eigen::Index>(alphabet.num_pairs()));
    std::vector<bool> seen(alphabet.num_pairs(), false);

    if (is_matrix_header(content[0].tokens, alphabet)) {
        if (detected) *detected = TableLayout::Matrix;

        std::vector<int> column_rank(K);
        for (size_t c = 0; c < K; ++c) {
            column_rank[c] = alphabet.letter_rank(content[0].tokens[c][0]);
        }

        for (size_t li = 1; li < content.size(); ++li) {
            const auto& row = content[li];
            if (row.tokens.size() != K + 1 || row.tokens[0].size() != 1) {
                throw TableLoadError(where(source, row.line_number) + ": expected a row letter and " +
                                     std::to_string(K) + " values, got " +
                                     std::to_string(row.tokens.size()) + " fields");
            }
            const int p = alphabet.letter_rank(row.tokens[0][0]);
            for (size_t c = 0; c < K; ++c) {
                double v = 0.0;
                if (!parse_double(row.tokens[c + 1], v)) {
                    throw TableLoadError(where(source, row.line_number) + ": malformed value '" +
                                         row.tokens[c + 1] + "'");
                }
                const size_t idx = static_cast<size_t>(column_rank[c]) * K + static_cast<size_t>(p);
                mark_seen(seen, idx, alphabet, where(source, row.line_number));
                coeffs[static_cast<Eigen::Index>(idx)] = v;
            }
        }
    } else {
        if (detected) *detected = TableLayout::PairList;

        for (size_t li = 0; li < content.size(); ++li) {
            const auto& row = content[li];
            if (row.tokens.size() != 2) {
                throw TableLoadError(where(source, row.line_number) + ": expected '<pair> <value>', got " +
                                     std::to_string(row.tokens.size()) + " fields");
            }
            double v = 0.0;
            if (!parse_double(row.tokens[1], v)) {
                if (li == 0) continue;   // header
                throw TableLoadError(where(source, row.line_number) + ": malformed value '" +
                                     row.tokens[1] + "'");
            }
            if (row.tokens[0].size() != 2) {
                throw TableLoadError(where(source, row.line_number) + ": pair key '" + row.tokens[0] +
                                     "' must have 2 letters");
            }
            const PairIndex idx = alphabet.key_to_index(row.tokens[0]);
            mark_seen(seen, idx, alphabet, where(source, row.line_number));
            coeffs[idx] = v;
        }
    }

    check_complete(seen, alphabet, source);
    return coeffs;
}

CoefficientVector load_coefficient_table(const std::string& path,
                                         const AminoAlphabet& alphabet) {
    return parse_coefficient_lines(read_lines(path), alphabet, path);
}

CoefficientVector coefficients_from_pairs(const std::map<std::string, double>& pairs,
                                          const AminoAlphabet& alphabet) {
    CoefficientVector coeffs = CoefficientVector::Zero(static_cast<Eigen::Index>(alphabet.num_pairs()));
    std::vector<bool> seen(alphabet.num_pairs(), false);
    for (const auto& [key, value] : pairs) {
        const PairIndex idx = alphabet.key_to_index(key);
        mark_seen(seen, idx, alphabet, "coefficient dictionary");
        coeffs[idx] = value;
    }
    check_complete(seen, alphabet, "coefficient dictionary");
    return coeffs;
}

void write_coefficient_table(const std::string& path,
                             const CoefficientVector& coeffs,
                             const AminoAlphabet& alphabet) {
    if (static_cast<size_t>(coeffs.size()) != alphabet.num_pairs()) {
        throw DimensionMismatch("Coefficient vector has " + std::to_string(coeffs.size()) +
                                " entries, expected " + std::to_string(alphabet.num_pairs()));
    }
    std::ofstream out(path);
    if (!out) {
        throw Error("Cannot open output file: " + path);
    }
    out << "pair\tcoefficient\n";
    out << std::setprecision(17);
    for (size_t i = 0; i < alphabet.num_pairs(); ++i) {
        out << alphabet.pair_key(i) << '\t' << coeffs[static_cast<Eigen::Index>(i)] << '\n';
    }
    if (!out) {
        throw Error("Write failed: " + path);
    }
}

}  // namespace mhcbind
