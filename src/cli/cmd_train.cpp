// mhcbind train: refine coefficients on the full training store
//
// Writes the refined coefficient table and, for linear model families, the
// model artifact used by 'mhcbind predict'.

#include "subcommand.hpp"
#include "mhcbind/amino_alphabet.hpp"
#include "mhcbind/coefficient_table.hpp"
#include "mhcbind/log_utils.hpp"
#include "mhcbind/model_artifact.hpp"
#include "mhcbind/refinement_loop.hpp"
#include "mhcbind/regression_model.hpp"
#include "mhcbind/training_store.hpp"

#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>

namespace mhcbind {
namespace cli {

int cmd_train(int argc, char* argv[]) {
    std::string store_file;
    std::string coeff_file;
    std::string model_file;
    std::string coeff_out;
    std::string model_name = "ridge-cv";
    RefinementParams params;
    size_t window_length = 9;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if ((strcmp(argv[i], "--store") == 0 || strcmp(argv[i], "-s") == 0) && i + 1 < argc) {
            store_file = argv[++i];
        } else if ((strcmp(argv[i], "--coeffs") == 0 || strcmp(argv[i], "-c") == 0) && i + 1 < argc) {
            coeff_file = argv[++i];
        } else if ((strcmp(argv[i], "--output") == 0 || strcmp(argv[i], "-o") == 0) && i + 1 < argc) {
            model_file = argv[++i];
        } else if (strcmp(argv[i], "--coeffs-out") == 0 && i + 1 < argc) {
            coeff_out = argv[++i];
        } else if ((strcmp(argv[i], "--model") == 0 || strcmp(argv[i], "-m") == 0) && i + 1 < argc) {
            model_name = argv[++i];
        } else if (strcmp(argv[i], "--rounds") == 0 && i + 1 < argc) {
            params.n_rounds = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (strcmp(argv[i], "--tol") == 0 && i + 1 < argc) {
            params.tol = std::stod(argv[++i]);
        } else if (strcmp(argv[i], "--reestimate-alpha") == 0 && i + 1 < argc) {
            params.reestimate.alpha = std::stod(argv[++i]);
        } else if (strcmp(argv[i], "--window") == 0 && i + 1 < argc) {
            window_length = std::stoul(argv[++i]);
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            std::cerr << "Usage: mhcbind train --store <train.mbt> --coeffs <table> -o <model.txt> [options]\n\n";
            std::cerr << "Refine pairwise coefficients on all training rows.\n\n";
            std::cerr << "Required:\n";
            std::cerr << "  --store, -s <file>     Training store from 'mhcbind generate'\n";
            std::cerr << "  --coeffs, -c <file>    Initial pairwise coefficient table\n";
            std::cerr << "  --output, -o <file>    Model artifact (linear model families only)\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --coeffs-out <file>    Also write the refined coefficient table\n";
            std::cerr << "  --model, -m <name>     ridge, ridge-cv, ols or two-stage (default: ridge-cv)\n";
            std::cerr << "  --rounds <int>         Refinement rounds (default: 5)\n";
            std::cerr << "  --tol <float>          Stop early below this coefficient change (default: 0, off)\n";
            std::cerr << "  --reestimate-alpha <f> Ridge penalty for re-estimation (default: 1.0)\n";
            std::cerr << "  --window <int>         Peptide window length of the store (default: 9)\n";
            std::cerr << "  -v, --verbose          Verbose output\n";
            std::cerr << "  --help, -h             Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (store_file.empty() || coeff_file.empty() || (model_file.empty() && coeff_out.empty())) {
        std::cerr << "Error: --store, --coeffs and one of --output / --coeffs-out are required\n";
        std::cerr << "Use --help for usage.\n";
        return 1;
    }

    auto t_start = std::chrono::steady_clock::now();
    const AminoAlphabet& alphabet = AminoAlphabet::standard();

    const TrainingSet data = load_training_set(store_file);
    if (window_length == 0 || data.X.cols() % window_length != 0) {
        std::cerr << "Error: store has " << data.X.cols() << " columns, not a multiple of window length "
                  << window_length << "\n";
        return 1;
    }
    const size_t mhc_length = data.X.cols() / window_length;
    const CoefficientVector initial = load_coefficient_table(coeff_file, alphabet);
    const auto family = make_model_family(model_name);

    if (verbose) {
        std::cerr << "Loaded " << data.size() << " training rows (window " << window_length
                  << ", pseudosequence length " << mhc_length << ")\n";
    }

    auto log_round = [&](const RefinementRound& round) {
        if (!verbose) return;
        std::cerr << "Round " << round.round << ": coeff "
                  << log_utils::format_head(*round.coefficients);
        if (!std::isnan(round.coefficient_change)) {
            std::cerr << ", change " << round.coefficient_change;
        }
        std::cerr << "\n";
    };

    const RefinementResult result = refine_coefficients(data.X, data.Y, data.W, alphabet, *family,
                                                        initial, params, log_round);

    if (!coeff_out.empty()) {
        write_coefficient_table(coeff_out, result.coefficients, alphabet);
        if (verbose) std::cerr << "Refined coefficients written: " << coeff_out << "\n";
    }
    if (!model_file.empty()) {
        const AffinityModel model = make_affinity_model(alphabet, window_length, mhc_length,
                                                        family->name(), result);
        save_affinity_model(model, model_file);
        if (verbose) std::cerr << "Model written: " << model_file << "\n";
    }

    if (verbose) {
        std::cerr << "Rounds: " << result.rounds.size()
                  << (result.converged ? " (converged)" : "") << "\n";
        std::cerr << "Total time: "
                  << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()) << "\n";
    }
    return 0;
}

namespace {
    struct TrainRegistrar {
        TrainRegistrar() {
            SubcommandRegistry::instance().register_command(
                "train",
                "Refine coefficients and save the trained model",
                cmd_train, 30);
        }
    };
    static TrainRegistrar registrar;
}

}  // namespace cli
}  // namespace mhcbind
