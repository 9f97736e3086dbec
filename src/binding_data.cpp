#include "mhcbind/binding_data.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/text_reader.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <set>

namespace mhcbind {

namespace {

std::string_view trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

size_t find_column(const std::vector<std::string>& header, const std::string& name,
                   const std::string& path) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (trim(header[i]) == name) return i;
    }
    throw TableLoadError(path + ": missing column '" + name + "'");
}

double median_sorted(const std::vector<double>& v) {
    const size_t n = v.size();
    return n % 2 == 1 ? v[n / 2] : 0.5 * (v[n / 2 - 1] + v[n / 2]);
}

double sample_std(const std::vector<double>& v) {
    double mean = 0.0;
    for (double x : v) mean += x;
    mean /= static_cast<double>(v.size());
    double ss = 0.0;
    for (double x : v) ss += (x - mean) * (x - mean);
    return std::sqrt(ss / static_cast<double>(v.size() - 1));
}

}  // namespace

std::vector<std::string> split_csv_line(std::string_view line, char delim) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delim) {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

std::string normalize_allele_name(std::string_view allele) {
    std::string out;
    out.reserve(allele.size());
    for (char c : trim(allele)) {
        if (c != '*') out += c;
    }
    return std::string(trim(out));
}

std::string normalize_peptide(std::string_view peptide) {
    std::string out(trim(peptide));
    for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

std::vector<BindingRecord> read_binding_records(const std::string& path,
                                                const BindingColumns& columns) {
    TextReader reader(path);
    std::string line;
    if (!reader.readline(line)) {
        throw TableLoadError(path + ": empty file");
    }
    const auto header = split_csv_line(line);
    const size_t allele_col = find_column(header, columns.allele, path);
    const size_t peptide_col = find_column(header, columns.peptide, path);
    const size_t ic50_col = find_column(header, columns.ic50, path);
    const size_t needed = std::max({allele_col, peptide_col, ic50_col}) + 1;

    std::vector<BindingRecord> records;
    while (reader.readline(line)) {
        if (trim(line).empty()) continue;
        const auto fields = split_csv_line(line);
        if (fields.size() < needed) {
            throw TableLoadError(path + ":" + std::to_string(reader.line_number()) + ": expected at least " +
                                 std::to_string(needed) + " fields, got " + std::to_string(fields.size()));
        }
        const std::string ic50_text(trim(fields[ic50_col]));
        if (ic50_text.empty()) continue;

        errno = 0;
        char* end = nullptr;
        const double ic50 = std::strtod(ic50_text.c_str(), &end);
        if (end != ic50_text.c_str() + ic50_text.size() || errno == ERANGE) {
            throw TableLoadError(path + ":" + std::to_string(reader.line_number()) +
                                 ": malformed IC50 '" + ic50_text + "'");
        }
        records.push_back({fields[allele_col], fields[peptide_col], ic50});
    }
    return records;
}

std::map<std::string, std::string> read_pseudosequences(const std::string& path,
                                                        const PseudosequenceColumns& columns) {
    TextReader reader(path);
    std::string line;
    if (!reader.readline(line)) {
        throw TableLoadError(path + ": empty file");
    }
    const auto header = split_csv_line(line);
    const size_t allele_col = find_column(header, columns.allele, path);
    const size_t residues_col = find_column(header, columns.residues, path);
    const size_t needed = std::max(allele_col, residues_col) + 1;

    std::map<std::string, std::string> out;
    while (reader.readline(line)) {
        if (trim(line).empty()) continue;
        const auto fields = split_csv_line(line);
        if (fields.size() < needed) {
            throw TableLoadError(path + ":" + std::to_string(reader.line_number()) + ": expected at least " +
                                 std::to_string(needed) + " fields, got " + std::to_string(fields.size()));
        }
        // Later rows win, as with a dictionary built in file order
        out[normalize_allele_name(fields[allele_col])] = normalize_peptide(fields[residues_col]);
    }
    return out;
}

std::vector<BindingRecord> aggregate_by_median(const std::vector<BindingRecord>& records,
                                               GenerationStats* stats) {
    std::map<std::pair<std::string, std::string>, std::vector<double>> groups;
    for (const auto& r : records) {
        groups[{r.allele, r.peptide}].push_back(r.ic50);
    }

    std::vector<BindingRecord> out;
    out.reserve(groups.size());
    std::vector<double> group_std;

    for (auto& [key, values] : groups) {
        std::sort(values.begin(), values.end());
        out.push_back({key.first, key.second, median_sorted(values)});
        if (values.size() > 1) {
            group_std.push_back(sample_std(values));
            if (stats) stats->duplicate_records += values.size();
        }
    }

    if (stats) {
        stats->duplicate_groups = group_std.size();
        stats->unique_pairs = out.size();
        if (!group_std.empty()) {
            double sum = 0.0;
            for (double s : group_std) sum += s;
            stats->duplicate_std_mean = sum / static_cast<double>(group_std.size());
            std::sort(group_std.begin(), group_std.end());
            stats->duplicate_std_median = median_sorted(group_std);
        }
    }
    return out;
}

TrainingSet build_training_set(const std::vector<BindingRecord>& records,
                               const std::map<std::string, std::string>& pseudosequences,
                               const AminoAlphabet& alphabet,
                               const GenerationParams& params,
                               GenerationStats* stats) {
    GenerationStats local;
    GenerationStats& st = stats ? *stats : local;
    st = GenerationStats();
    st.records_loaded = records.size();

    std::vector<BindingRecord> kept;
    kept.reserve(records.size());
    for (const auto& r : records) {
        BindingRecord n{normalize_allele_name(r.allele), normalize_peptide(r.peptide), r.ic50};
        if (!(n.ic50 > 0.0) || !std::isfinite(n.ic50)) {
            throw InvalidValue("IC50 for " + n.allele + " / " + n.peptide +
                               " is not strictly positive (" + std::to_string(n.ic50) + ")");
        }
        if (n.peptide.size() < params.window_length ||
            (params.max_peptide_length > 0 && n.peptide.size() > params.max_peptide_length)) {
            st.length_filtered++;
            continue;
        }
        if (n.ic50 > params.max_ic50) {
            st.ic50_filtered++;
            continue;
        }
        kept.push_back(std::move(n));
    }
    st.records_kept = kept.size();

    if (params.verbose) {
        std::cerr << "Loaded " << st.records_loaded << " binding records\n";
        std::cerr << "  Keeping " << st.records_kept << " (" << st.length_filtered
                  << " outside length range, " << st.ic50_filtered << " above IC50 cap)\n";
    }

    const std::vector<BindingRecord> unique = aggregate_by_median(kept, &st);

    std::set<std::string> alleles;
    for (const auto& r : unique) alleles.insert(r.allele);
    st.unique_alleles = alleles.size();
    for (const auto& a : alleles) {
        if (pseudosequences.count(a)) {
            st.common_alleles++;
        } else {
            st.missing_alleles.push_back(a);
        }
    }

    if (params.verbose) {
        std::cerr << "  Found " << st.duplicate_records << " duplicate entries in "
                  << st.duplicate_groups << " groups\n";
        std::cerr << "  Std in each group: " << st.duplicate_std_mean << " mean, "
                  << st.duplicate_std_median << " median\n";
        std::cerr << "  " << st.unique_alleles << " unique alleles, " << st.common_alleles
                  << " with pseudosequences\n";
        if (!st.missing_alleles.empty()) {
            std::cerr << "  Missing pseudosequences for:";
            for (const auto& a : st.missing_alleles) std::cerr << ' ' << a;
            std::cerr << "\n";
        }
    }

    if (!params.drop_unknown_alleles && !st.missing_alleles.empty()) {
        throw MissingPseudosequence(st.missing_alleles.front());
    }

    PairEncoder encoder(alphabet, params.window_length);
    TrainingSet out;
    std::vector<double> weights;
    std::vector<double> targets;

    for (const auto& r : unique) {
        auto it = pseudosequences.find(r.allele);
        if (it == pseudosequences.end()) {
            st.dropped_missing_allele++;
            continue;
        }
        const char bad = alphabet.first_unknown(r.peptide);
        if (bad != '\0') {
            if (params.skip_invalid_peptides) {
                st.skipped_invalid_peptides++;
                continue;
            }
            throw UnknownSymbol(bad, "peptide " + r.peptide + " (" + r.allele + ")");
        }
        const size_t n = encoder.append_peptide(r.peptide, it->second, out.X, weights);
        targets.insert(targets.end(), n, r.ic50);
        st.encoded_peptides++;
        st.windows += n;
    }

    out.Y = Eigen::Map<const Eigen::VectorXd>(targets.data(), static_cast<Eigen::Index>(targets.size()));
    out.W = Eigen::Map<const Eigen::VectorXd>(weights.data(), static_cast<Eigen::Index>(weights.size()));

    if (params.verbose) {
        std::cerr << "Generated " << out.X.rows() << " x " << out.X.cols() << " index matrix from "
                  << st.encoded_peptides << " peptides";
        if (st.skipped_invalid_peptides > 0) {
            std::cerr << " (" << st.skipped_invalid_peptides << " skipped for unknown symbols)";
        }
        std::cerr << "\n";
    }
    return out;
}

}  // namespace mhcbind
