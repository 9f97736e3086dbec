// mhcbind predict: score (allele, peptide) pairs with a trained model
//
// Input is a tab- or comma-separated file with allele and peptide columns;
// an optional header line starting with "allele" is skipped. Peptides longer
// than the window are scored as the geometric mean over all windows.

#include "subcommand.hpp"
#include "mhcbind/binding_data.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/model_artifact.hpp"
#include "mhcbind/text_reader.hpp"

#include <cctype>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace mhcbind {
namespace cli {

int cmd_predict(int argc, char* argv[]) {
    std::string model_file;
    std::string pseudo_file;
    std::string input_file;
    std::string output_file;
    bool skip_unknown = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if ((strcmp(argv[i], "--model") == 0 || strcmp(argv[i], "-m") == 0) && i + 1 < argc) {
            model_file = argv[++i];
        } else if ((strcmp(argv[i], "--pseudo") == 0 || strcmp(argv[i], "-p") == 0) && i + 1 < argc) {
            pseudo_file = argv[++i];
        } else if ((strcmp(argv[i], "--input") == 0 || strcmp(argv[i], "-i") == 0) && i + 1 < argc) {
            input_file = argv[++i];
        } else if ((strcmp(argv[i], "--output") == 0 || strcmp(argv[i], "-o") == 0) && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "--skip-unknown") == 0) {
            skip_unknown = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            std::cerr << "Usage: mhcbind predict --model <model.txt> --pseudo <seqs.csv> --input <pairs.tsv> [options]\n\n";
            std::cerr << "Predict IC50 for allele/peptide pairs.\n\n";
            std::cerr << "Required:\n";
            std::cerr << "  --model, -m <file>     Model artifact from 'mhcbind train'\n";
            std::cerr << "  --pseudo, -p <file>    Allele pseudosequence CSV\n";
            std::cerr << "  --input, -i <file>     allele<TAB>peptide per line (plain or .gz)\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --output, -o <file>    Output TSV (default: stdout)\n";
            std::cerr << "  --skip-unknown         Skip pairs with unknown alleles or residues\n";
            std::cerr << "  -v, --verbose          Verbose output\n";
            std::cerr << "  --help, -h             Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (model_file.empty() || pseudo_file.empty() || input_file.empty()) {
        std::cerr << "Error: --model, --pseudo and --input are required\n";
        std::cerr << "Use --help for usage.\n";
        return 1;
    }

    const AffinityModel model = load_affinity_model(model_file);
    const auto pseudosequences = read_pseudosequences(pseudo_file);

    std::ofstream file_out;
    if (!output_file.empty()) {
        file_out.open(output_file);
        if (!file_out) {
            std::cerr << "Error: Cannot open output file: " << output_file << "\n";
            return 1;
        }
    }
    std::ostream& out = output_file.empty() ? std::cout : file_out;
    out << "allele\tpeptide\tic50\n";

    TextReader reader(input_file);
    std::string line;
    size_t n_scored = 0;
    size_t n_skipped = 0;

    while (reader.readline(line)) {
        const char delim = line.find('\t') != std::string::npos ? '\t' : ',';
        const auto fields = split_csv_line(line, delim);
        if (fields.size() < 2) continue;

        const std::string allele = normalize_allele_name(fields[0]);
        const std::string peptide = normalize_peptide(fields[1]);
        if (reader.line_number() == 1) {
            std::string lower = allele;
            for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower.rfind("allele", 0) == 0 || lower.rfind("mhc", 0) == 0) continue;
        }

        auto it = pseudosequences.find(allele);
        if (it == pseudosequences.end()) {
            if (skip_unknown) {
                n_skipped++;
                continue;
            }
            throw MissingPseudosequence(allele);
        }
        const char bad = model.alphabet.first_unknown(peptide);
        if (bad != '\0') {
            if (skip_unknown) {
                n_skipped++;
                continue;
            }
            throw UnknownSymbol(bad, "peptide " + peptide);
        }

        const double ic50 = model.predict_peptide(peptide, it->second);
        out << allele << '\t' << peptide << '\t' << std::setprecision(6) << ic50 << '\n';
        n_scored++;
    }

    if (verbose) {
        std::cerr << "Scored " << n_scored << " pairs";
        if (n_skipped > 0) std::cerr << " (" << n_skipped << " skipped)";
        std::cerr << "\n";
    }
    return 0;
}

namespace {
    struct PredictRegistrar {
        PredictRegistrar() {
            SubcommandRegistry::instance().register_command(
                "predict",
                "Predict IC50 with a trained model",
                cmd_predict, 40);
        }
    };
    static PredictRegistrar registrar;
}

}  // namespace cli
}  // namespace mhcbind
