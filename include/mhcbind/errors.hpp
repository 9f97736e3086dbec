#pragma once
// Error taxonomy
//
// Every failure inside the library is reported by throwing one of these.
// Nothing is retried: a failed fit aborts the refinement loop, a failed fold
// aborts the whole cross-validation pass. The CLI catches mhcbind::Error at
// the subcommand boundary.

#include <stdexcept>
#include <string>

namespace mhcbind {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Shape/length contract violated between paired arrays
class DimensionMismatch : public Error {
public:
    explicit DimensionMismatch(const std::string& what) : Error(what) {}
};

// Pair index >= number of pairs, or category beyond the trained range
class IndexOutOfRange : public Error {
public:
    explicit IndexOutOfRange(const std::string& what) : Error(what) {}
};

// Character outside the amino acid alphabet
class UnknownSymbol : public Error {
public:
    UnknownSymbol(char symbol, const std::string& context)
        : Error("Unknown amino acid symbol '" + std::string(1, symbol) + "'" +
                (context.empty() ? std::string() : " in " + context)),
          symbol_(symbol) {}

    char symbol() const { return symbol_; }

private:
    char symbol_;
};

// Two-stage model has no regressor for a predicted category
class EmptyCategory : public Error {
public:
    explicit EmptyCategory(int category)
        : Error("No training samples for affinity category " + std::to_string(category)),
          category_(category) {}

    int category() const { return category_; }

private:
    int category_;
};

// Least-squares solve failed (singular system, non-finite solution)
class NumericalFailure : public Error {
public:
    explicit NumericalFailure(const std::string& what) : Error(what) {}
};

// Value outside its domain (non-positive affinity, negative sample weight)
class InvalidValue : public Error {
public:
    explicit InvalidValue(const std::string& what) : Error(what) {}
};

// Coefficient table or text input could not be loaded
class TableLoadError : public Error {
public:
    explicit TableLoadError(const std::string& what) : Error(what) {}
};

// Training store could not be written or read back
class StoreError : public Error {
public:
    explicit StoreError(const std::string& what) : Error(what) {}
};

// Allele without a known pseudosequence (only when dropping is disabled)
class MissingPseudosequence : public Error {
public:
    explicit MissingPseudosequence(const std::string& allele)
        : Error("No pseudosequence for allele " + allele) {}
};

}  // namespace mhcbind
