// mhcbind cv: k-fold cross-validation of the refinement loop
//
// Per-fold, per-round test metrics go to a TSV (stdout by default); the
// overall error is printed last.

#include "subcommand.hpp"
#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/coefficient_table.hpp"
#include "mhcbind/cross_validation.hpp"
#include "mhcbind/log_utils.hpp"
#include "mhcbind/regression_model.hpp"
#include "mhcbind/training_store.hpp"

#include <chrono>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace mhcbind {
namespace cli {

int cmd_cv(int argc, char* argv[]) {
    std::string store_file;
    std::string coeff_file;
    std::string output_file;
    std::string model_name = "ridge-cv";
    CrossValidationParams params;
    uint64_t seed = 0;
    bool shuffle = true;

    for (int i = 1; i < argc; ++i) {
        if ((strcmp(argv[i], "--store") == 0 || strcmp(argv[i], "-s") == 0) && i + 1 < argc) {
            store_file = argv[++i];
        } else if ((strcmp(argv[i], "--coeffs") == 0 || strcmp(argv[i], "-c") == 0) && i + 1 < argc) {
            coeff_file = argv[++i];
        } else if ((strcmp(argv[i], "--output") == 0 || strcmp(argv[i], "-o") == 0) && i + 1 < argc) {
            output_file = argv[++i];
        } else if ((strcmp(argv[i], "--folds") == 0 || strcmp(argv[i], "-k") == 0) && i + 1 < argc) {
            params.n_folds = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (strcmp(argv[i], "--rounds") == 0 && i + 1 < argc) {
            params.refinement.n_rounds = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (strcmp(argv[i], "--tol") == 0 && i + 1 < argc) {
            params.refinement.tol = std::stod(argv[++i]);
        } else if (strcmp(argv[i], "--reestimate-alpha") == 0 && i + 1 < argc) {
            params.refinement.reestimate.alpha = std::stod(argv[++i]);
        } else if ((strcmp(argv[i], "--model") == 0 || strcmp(argv[i], "-m") == 0) && i + 1 < argc) {
            model_name = argv[++i];
        } else if (strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
            params.binder_threshold = std::stod(argv[++i]);
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            seed = std::stoull(argv[++i]);
        } else if (strcmp(argv[i], "--no-shuffle") == 0) {
            shuffle = false;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            params.verbose = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            std::cerr << "Usage: mhcbind cv --store <train.mbt> --coeffs <table> [options]\n\n";
            std::cerr << "Cross-validate the alternating coefficient refinement.\n\n";
            std::cerr << "Required:\n";
            std::cerr << "  --store, -s <file>     Training store from 'mhcbind generate'\n";
            std::cerr << "  --coeffs, -c <file>    Initial pairwise coefficient table\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --output, -o <file>    Per-fold metrics TSV (default: stdout)\n";
            std::cerr << "  --folds, -k <int>      Number of contiguous folds (default: 10)\n";
            std::cerr << "  --rounds <int>         Refinement rounds per fold (default: 5)\n";
            std::cerr << "  --tol <float>          Stop early below this coefficient change (default: 0, off)\n";
            std::cerr << "  --reestimate-alpha <f> Ridge penalty for re-estimation (default: 1.0)\n";
            std::cerr << "  --model, -m <name>     ridge, ridge-cv, ols or two-stage (default: ridge-cv)\n";
            std::cerr << "  --threshold <float>    Binder IC50 cut-off (default: 500)\n";
            std::cerr << "  --seed <int>           Shuffle seed (default: 0)\n";
            std::cerr << "  --no-shuffle           Keep the stored row order\n";
            std::cerr << "  -v, --verbose          Verbose output\n";
            std::cerr << "  --help, -h             Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (store_file.empty() || coeff_file.empty()) {
        std::cerr << "Error: --store and --coeffs are required\n";
        std::cerr << "Use --help for usage.\n";
        return 1;
    }

    auto t_start = std::chrono::steady_clock::now();
    const AminoAlphabet& alphabet = AminoAlphabet::standard();

    TrainingSet data = load_training_set(store_file);
    const CoefficientVector initial = load_coefficient_table(coeff_file, alphabet);
    const auto family = make_model_family(model_name);

    if (params.verbose) {
        std::cerr << "Loaded " << data.size() << " x " << data.X.cols() << " training rows from "
                  << store_file << "\n";
        std::cerr << "Model: " << family->name() << ", folds: " << params.n_folds
                  << ", rounds: " << params.refinement.n_rounds << "\n";
    }
    if (shuffle) shuffle_training_set(data, seed);

    const CrossValidationResult result = cross_validate(data, initial, alphabet, *family, params);

    std::ofstream file_out;
    if (!output_file.empty()) {
        file_out.open(output_file);
        if (!file_out) {
            std::cerr << "Error: Cannot open output file: " << output_file << "\n";
            return 1;
        }
    }
    std::ostream& out = output_file.empty() ? std::cout : file_out;

    out << "fold\tround\ttrain_n\ttest_n\tcoeff_change\terror\tmean_error\tmedian_error"
           "\taccuracy\tsensitivity\tspecificity\tprecision\n";
    for (const auto& fold : result.folds) {
        for (const auto& r : fold.rounds) {
            out << (fold.fold + 1) << '\t' << r.round << '\t'
                << fold.train_size << '\t' << fold.test_size << '\t'
                << std::setprecision(6) << r.coefficient_change << '\t'
                << r.test.weighted_mae << '\t' << r.test.mean_abs_error << '\t'
                << r.test.median_abs_error << '\t' << r.test.accuracy << '\t'
                << r.test.sensitivity << '\t' << r.test.specificity << '\t'
                << r.test.precision << '\n';
        }
    }

    std::cout << "Overall CV error: " << result.mean_error << "\n";

    if (params.verbose) {
        std::cerr << "Error by round:";
        for (double e : result.mean_error_by_round) std::cerr << ' ' << e;
        std::cerr << "\n";
        std::cerr << "Total time: "
                  << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()) << "\n";
    }
    return 0;
}

namespace {
    struct CvRegistrar {
        CvRegistrar() {
            SubcommandRegistry::instance().register_command(
                "cv",
                "Cross-validate coefficient refinement",
                cmd_cv, 20);
        }
    };
    static CvRegistrar registrar;
}

}  // namespace cli
}  // namespace mhcbind
