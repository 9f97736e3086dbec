// mhcbind generate: binding CSV + pseudosequences -> training store
//
// Cleans the assay table, aggregates duplicate measurements by median,
// encodes every peptide window against its allele pseudosequence and writes
// the X/Y/W arrays to a binary store.

#include "subcommand.hpp"
#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/binding_data.hpp"
#include "mhcbind/log_utils.hpp"
#include "mhcbind/training_store.hpp"

#include <chrono>
#include <cstring>
#include <iostream>

namespace mhcbind {
namespace cli {

int cmd_generate(int argc, char* argv[]) {
    std::string binding_file;
    std::string pseudo_file;
    std::string output_file;
    BindingColumns columns;
    GenerationParams params;
    bool compress = true;

    for (int i = 1; i < argc; ++i) {
        if ((strcmp(argv[i], "--binding") == 0 || strcmp(argv[i], "-b") == 0) && i + 1 < argc) {
            binding_file = argv[++i];
        } else if ((strcmp(argv[i], "--pseudo") == 0 || strcmp(argv[i], "-p") == 0) && i + 1 < argc) {
            pseudo_file = argv[++i];
        } else if ((strcmp(argv[i], "--output") == 0 || strcmp(argv[i], "-o") == 0) && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "--window") == 0 && i + 1 < argc) {
            params.window_length = std::stoul(argv[++i]);
        } else if (strcmp(argv[i], "--max-length") == 0 && i + 1 < argc) {
            params.max_peptide_length = std::stoul(argv[++i]);
        } else if (strcmp(argv[i], "--max-ic50") == 0 && i + 1 < argc) {
            params.max_ic50 = std::stod(argv[++i]);
        } else if (strcmp(argv[i], "--allele-col") == 0 && i + 1 < argc) {
            columns.allele = argv[++i];
        } else if (strcmp(argv[i], "--peptide-col") == 0 && i + 1 < argc) {
            columns.peptide = argv[++i];
        } else if (strcmp(argv[i], "--ic50-col") == 0 && i + 1 < argc) {
            columns.ic50 = argv[++i];
        } else if (strcmp(argv[i], "--require-alleles") == 0) {
            params.drop_unknown_alleles = false;
        } else if (strcmp(argv[i], "--skip-invalid") == 0) {
            params.skip_invalid_peptides = true;
        } else if (strcmp(argv[i], "--no-compress") == 0) {
            compress = false;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            params.verbose = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            std::cerr << "Usage: mhcbind generate --binding <mhc1.csv> --pseudo <seqs.csv> -o <train.mbt> [options]\n\n";
            std::cerr << "Build a training store from binding measurements.\n\n";
            std::cerr << "Required:\n";
            std::cerr << "  --binding, -b <file>   Binding CSV (plain or .gz)\n";
            std::cerr << "  --pseudo, -p <file>    Allele pseudosequence CSV (columns Allele, Residues)\n";
            std::cerr << "  --output, -o <file>    Output training store (.mbt)\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --window <int>         Peptide window length (default: 9)\n";
            std::cerr << "  --max-length <int>     Drop peptides longer than this (default: no limit)\n";
            std::cerr << "  --max-ic50 <float>     Drop measurements above this IC50 (default: 1e6)\n";
            std::cerr << "  --allele-col <name>    Allele column (default: \"MHC Allele\")\n";
            std::cerr << "  --peptide-col <name>   Peptide column (default: \"Epitope\")\n";
            std::cerr << "  --ic50-col <name>      IC50 column (default: \"IC50\")\n";
            std::cerr << "  --require-alleles      Fail on alleles without a pseudosequence\n";
            std::cerr << "  --skip-invalid         Skip peptides with non-standard residues\n";
            std::cerr << "  --no-compress          Write uncompressed sections\n";
            std::cerr << "  -v, --verbose          Verbose output\n";
            std::cerr << "  --help, -h             Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (binding_file.empty() || pseudo_file.empty() || output_file.empty()) {
        std::cerr << "Error: --binding, --pseudo and --output are required\n";
        std::cerr << "Use --help for usage.\n";
        return 1;
    }

    auto t_start = std::chrono::steady_clock::now();

    const auto records = read_binding_records(binding_file, columns);
    const auto pseudosequences = read_pseudosequences(pseudo_file);
    if (params.verbose) {
        std::cerr << "Loaded " << pseudosequences.size() << " allele pseudosequences\n";
    }

    GenerationStats stats;
    const TrainingSet data = build_training_set(records, pseudosequences, AminoAlphabet::standard(),
                                                params, &stats);
    save_training_set(data, output_file, compress);

    if (params.verbose) {
        std::cerr << "Wrote " << output_file << " (" << data.size() << " rows, "
                  << (compress && store_has_zstd() ? "zstd" : "raw") << ")\n";
        std::cerr << "Total time: "
                  << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()) << "\n";
    }
    return 0;
}

namespace {
    struct GenerateRegistrar {
        GenerateRegistrar() {
            SubcommandRegistry::instance().register_command(
                "generate",
                "Build a training store from binding measurements",
                cmd_generate, 10);
        }
    };
    static GenerateRegistrar registrar;
}

}  // namespace cli
}  // namespace mhcbind
