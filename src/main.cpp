// mhcbind: generate -> cv -> train -> predict
//
//   mhcbind generate --binding <csv> --pseudo <csv> -o <store.mbt>
//   mhcbind cv       --store <store.mbt> --coeffs <table>
//   mhcbind train    --store <store.mbt> --coeffs <table> -o <model.txt>
//   mhcbind predict  --model <model.txt> --pseudo <csv> --input <pairs.tsv>

#include "cli/subcommand.hpp"

int main(int argc, char* argv[]) {
    return mhcbind::cli::SubcommandRegistry::instance().dispatch(argc, argv);
}
