#pragma once
// Binary training store (.mbt)
//
// Layout (little-endian):
//
//   StoreHeader          64 bytes
//   X section            rows * cols uint16 pair indices, row-major
//   Y section            rows float64 IC50 values
//   W section            rows float64 sample weights
//
// Sections are ZSTD-compressed when the build has ZSTD and compression is
// requested; the header's codec applies to all three. Section sizes in the
// header are on-disk (possibly compressed) sizes.

#include <cstdint>
#include <string>

#include "mhcbind/types.hpp"

namespace mhcbind {

constexpr uint64_t STORE_MAGIC = 0x313053544243484DULL;  // "MHCBTS01"
constexpr uint32_t STORE_VERSION = 1;

enum class StoreCodec : uint8_t {
    NONE = 0,
    ZSTD = 1,
};

struct StoreHeader {
    uint64_t magic = STORE_MAGIC;       // 8
    uint32_t version = STORE_VERSION;   // 4
    StoreCodec codec = StoreCodec::NONE;// 1
    uint8_t reserved0[3] = {0, 0, 0};   // 3
    uint64_t rows = 0;                  // 8
    uint64_t cols = 0;                  // 8
    uint64_t x_bytes = 0;               // 8
    uint64_t y_bytes = 0;               // 8
    uint64_t w_bytes = 0;               // 8
    uint64_t reserved1 = 0;             // 8
};
static_assert(sizeof(StoreHeader) == 64);

// True when this build can write and read ZSTD sections
bool store_has_zstd();

// Validates the set first. compress is ignored without ZSTD support.
// Throws StoreError on I/O failure.
void save_training_set(const TrainingSet& data, const std::string& path, bool compress = true);

// Throws StoreError for a bad magic or version, truncated sections, a ZSTD
// section in a build without ZSTD, or contents that fail validation.
TrainingSet load_training_set(const std::string& path);

// Header only, for inspection
StoreHeader read_store_header(const std::string& path);

}  // namespace mhcbind
