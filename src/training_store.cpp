#include "mhcbind/training_store.hpp"
#include "mhcbind/errors.hpp"

#include <cstring>
#include <fstream>
#include <limits>
#include <vector>

#ifdef HAVE_ZSTD
#include <zstd.h>
#endif

namespace mhcbind {

namespace {

constexpr int kZstdLevel = 3;

std::vector<char> encode_section(const void* src, size_t size, StoreCodec codec) {
    switch (codec) {
        case StoreCodec::NONE: {
            std::vector<char> out(size);
            if (size) std::memcpy(out.data(), src, size);
            return out;
        }
        case StoreCodec::ZSTD:
#ifdef HAVE_ZSTD
        {
            std::vector<char> out(ZSTD_compressBound(size));
            const size_t got = ZSTD_compress(out.data(), out.size(), src, size, kZstdLevel);
            if (ZSTD_isError(got)) {
                throw StoreError(std::string("ZSTD compression failed: ") + ZSTD_getErrorName(got));
            }
            out.resize(got);
            return out;
        }
#else
            throw StoreError("ZSTD requested but this build has no ZSTD support");
#endif
    }
    throw StoreError("Unsupported store codec");
}

void decode_section(const std::vector<char>& src, void* dst, size_t expected, StoreCodec codec,
                    const char* name) {
    switch (codec) {
        case StoreCodec::NONE:
            if (src.size() != expected) {
                throw StoreError(std::string("Store section ") + name + " has " +
                                 std::to_string(src.size()) + " bytes, expected " +
                                 std::to_string(expected));
            }
            if (expected) std::memcpy(dst, src.data(), expected);
            return;
        case StoreCodec::ZSTD:
#ifdef HAVE_ZSTD
        {
            const size_t got = ZSTD_decompress(dst, expected, src.data(), src.size());
            if (ZSTD_isError(got) || got != expected) {
                throw StoreError(std::string("ZSTD decompression of store section ") + name + " failed");
            }
            return;
        }
#else
            throw StoreError("Training store uses ZSTD but this build has no ZSTD support");
#endif
    }
    throw StoreError("Unsupported store codec " + std::to_string(static_cast<int>(codec)));
}

// Byte size a section must decode to. Checked before anything is allocated so a
// corrupt header cannot request an unbounded buffer.
void check_section_size(const std::vector<char>& raw, uint64_t expected, StoreCodec codec,
                        const std::string& path, const char* name) {
    if (codec == StoreCodec::NONE) {
        if (raw.size() != expected) {
            throw StoreError(path + ": section " + name + " has " + std::to_string(raw.size()) +
                             " bytes, header implies " + std::to_string(expected));
        }
        return;
    }
#ifdef HAVE_ZSTD
    const unsigned long long content = ZSTD_getFrameContentSize(raw.data(), raw.size());
    if (content == ZSTD_CONTENTSIZE_ERROR || content == ZSTD_CONTENTSIZE_UNKNOWN ||
        content != expected) {
        throw StoreError(path + ": section " + name + " does not decode to " +
                         std::to_string(expected) + " bytes");
    }
#else
    (void)raw;
    (void)expected;
    throw StoreError(path + ": training store uses ZSTD but this build has no ZSTD support");
#endif
}

std::vector<char> read_exact(std::ifstream& in, uint64_t n, uint64_t remaining,
                             const std::string& path, const char* name) {
    if (n > remaining) {
        throw StoreError(path + ": truncated section " + name);
    }
    std::vector<char> buf(static_cast<size_t>(n));
    if (n && !in.read(buf.data(), static_cast<std::streamsize>(n))) {
        throw StoreError(path + ": truncated section " + name);
    }
    return buf;
}

void check_header(const StoreHeader& h, const std::string& path) {
    if (h.magic != STORE_MAGIC) {
        throw StoreError(path + ": not a training store (bad magic)");
    }
    if (h.version != STORE_VERSION) {
        throw StoreError(path + ": unsupported store version " + std::to_string(h.version));
    }
    if (h.codec != StoreCodec::NONE && h.codec != StoreCodec::ZSTD) {
        throw StoreError(path + ": unknown codec " + std::to_string(static_cast<int>(h.codec)));
    }
}

}  // namespace

bool store_has_zstd() {
#ifdef HAVE_ZSTD
    return true;
#else
    return false;
#endif
}

void save_training_set(const TrainingSet& data, const std::string& path, bool compress) {
    data.validate();

    StoreHeader h;
    h.codec = (compress && store_has_zstd()) ? StoreCodec::ZSTD : StoreCodec::NONE;
    h.rows = data.X.rows();
    h.cols = data.X.cols();

    const auto x = encode_section(data.X.data().data(), data.X.data().size() * sizeof(PairIndex), h.codec);
    const auto y = encode_section(data.Y.data(), static_cast<size_t>(data.Y.size()) * sizeof(double), h.codec);
    const auto w = encode_section(data.W.data(), static_cast<size_t>(data.W.size()) * sizeof(double), h.codec);
    h.x_bytes = x.size();
    h.y_bytes = y.size();
    h.w_bytes = w.size();

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StoreError("Cannot open training store for writing: " + path);
    }
    out.write(reinterpret_cast<const char*>(&h), sizeof(h));
    out.write(x.data(), static_cast<std::streamsize>(x.size()));
    out.write(y.data(), static_cast<std::streamsize>(y.size()));
    out.write(w.data(), static_cast<std::streamsize>(w.size()));
    if (!out) {
        throw StoreError("Write failed: " + path);
    }
}

StoreHeader read_store_header(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StoreError("Cannot open training store: " + path);
    }
    StoreHeader h;
    if (!in.read(reinterpret_cast<char*>(&h), sizeof(h))) {
        throw StoreError(path + ": truncated header");
    }
    check_header(h, path);
    return h;
}

TrainingSet load_training_set(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StoreError("Cannot open training store: " + path);
    }
    StoreHeader h;
    if (!in.read(reinterpret_cast<char*>(&h), sizeof(h))) {
        throw StoreError(path + ": truncated header");
    }
    check_header(h, path);

    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    if (h.rows > kMax / sizeof(double) ||
        (h.cols != 0 && h.rows > kMax / sizeof(PairIndex) / h.cols)) {
        throw StoreError(path + ": header shape " + std::to_string(h.rows) + " x " +
                         std::to_string(h.cols) + " overflows");
    }
    const uint64_t x_expected = h.rows * h.cols * sizeof(PairIndex);
    const uint64_t v_expected = h.rows * sizeof(double);

    in.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(in.tellg());
    in.seekg(static_cast<std::streamoff>(sizeof(h)), std::ios::beg);
    uint64_t remaining = file_size - sizeof(h);

    const auto x_raw = read_exact(in, h.x_bytes, remaining, path, "X");
    remaining -= h.x_bytes;
    const auto y_raw = read_exact(in, h.y_bytes, remaining, path, "Y");
    remaining -= h.y_bytes;
    const auto w_raw = read_exact(in, h.w_bytes, remaining, path, "W");

    check_section_size(x_raw, x_expected, h.codec, path, "X");
    check_section_size(y_raw, v_expected, h.codec, path, "Y");
    check_section_size(w_raw, v_expected, h.codec, path, "W");

    const size_t n = static_cast<size_t>(h.rows);
    const size_t d = static_cast<size_t>(h.cols);

    std::vector<PairIndex> x(n * d);
    decode_section(x_raw, x.data(), x.size() * sizeof(PairIndex), h.codec, "X");

    TrainingSet data;
    data.X = IndexMatrix::from_data(n, d, std::move(x));
    data.Y.resize(static_cast<Eigen::Index>(n));
    data.W.resize(static_cast<Eigen::Index>(n));
    decode_section(y_raw, data.Y.data(), n * sizeof(double), h.codec, "Y");
    decode_section(w_raw, data.W.data(), n * sizeof(double), h.codec, "W");

    try {
        data.validate();
    } catch (const Error& e) {
        throw StoreError(path + ": " + e.what());
    }
    return data;
}

}  // namespace mhcbind
