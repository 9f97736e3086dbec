#pragma once
/**
 * @file binding_data.hpp
 * @brief Binding-assay ingestion and training set generation
 *
 * Reads peptide/allele/IC50 measurements and allele pseudosequences from CSV
 * (plain or gzipped), cleans them and encodes every peptide window into one
 * row of the training set:
 *
 *   1. allele names lose '*' and surrounding whitespace; peptides are trimmed
 *      and upper-cased
 *   2. peptides shorter than the window (or longer than max_peptide_length)
 *      and IC50 above max_ic50 are dropped
 *   3. duplicate (allele, peptide) measurements collapse to their median
 *   4. alleles without a pseudosequence are dropped (or rejected)
 *   5. each window of a peptide gets weight 1 / (number of windows)
 */

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "mhcbind/pair_encoder.hpp"
#include "mhcbind/types.hpp"

namespace mhcbind {

struct BindingRecord {
    std::string allele;
    std::string peptide;
    double ic50 = 0.0;
};

struct BindingColumns {
    std::string allele = "MHC Allele";
    std::string peptide = "Epitope";
    std::string ic50 = "IC50";
};

struct PseudosequenceColumns {
    std::string allele = "Allele";
    std::string residues = "Residues";
};

// RFC 4180 style: quoted fields may contain the delimiter and "" escapes
std::vector<std::string> split_csv_line(std::string_view line, char delim = ',');

std::string normalize_allele_name(std::string_view allele);
std::string normalize_peptide(std::string_view peptide);

// Raw records as they appear in the file; rows with an empty IC50 cell are
// skipped. Throws TableLoadError for missing columns or malformed numbers.
std::vector<BindingRecord> read_binding_records(const std::string& path,
                                                const BindingColumns& columns = BindingColumns());

// Normalized allele name -> upper-case residues
std::map<std::string, std::string> read_pseudosequences(
    const std::string& path,
    const PseudosequenceColumns& columns = PseudosequenceColumns());

struct GenerationParams {
    size_t window_length = 9;
    size_t max_peptide_length = 0;      // 0 = no upper bound
    double max_ic50 = 1e6;
    bool drop_unknown_alleles = true;   // false: MissingPseudosequence
    bool skip_invalid_peptides = false; // false: UnknownSymbol
    bool verbose = false;
};

struct GenerationStats {
    size_t records_loaded = 0;
    size_t length_filtered = 0;
    size_t ic50_filtered = 0;
    size_t records_kept = 0;
    size_t duplicate_records = 0;       // records in groups of size > 1
    size_t duplicate_groups = 0;
    double duplicate_std_mean = 0.0;    // per-group sample std of IC50
    double duplicate_std_median = 0.0;
    size_t unique_pairs = 0;
    size_t unique_alleles = 0;
    size_t common_alleles = 0;
    std::vector<std::string> missing_alleles;
    size_t dropped_missing_allele = 0;
    size_t skipped_invalid_peptides = 0;
    size_t encoded_peptides = 0;
    size_t windows = 0;
};

// One record per (allele, peptide), sorted by allele then peptide
std::vector<BindingRecord> aggregate_by_median(const std::vector<BindingRecord>& records,
                                               GenerationStats* stats = nullptr);

TrainingSet build_training_set(const std::vector<BindingRecord>& records,
                               const std::map<std::string, std::string>& pseudosequences,
                               const AminoAlphabet& alphabet,
                               const GenerationParams& params = GenerationParams(),
                               GenerationStats* stats = nullptr);

}  // namespace mhcbind
