#pragma once
// Line reader for plain or gzip-compressed text inputs
//
// zlib's gzopen reads uncompressed files transparently, so one code path
// serves .csv, .csv.gz, .txt and .txt.gz alike.

#include <cstddef>
#include <string>
#include <vector>

#include <zlib.h>

namespace mhcbind {

class TextReader {
public:
    static constexpr size_t GZBUF_SIZE = 1024 * 1024;

    // Throws TableLoadError if the file cannot be opened
    explicit TextReader(const std::string& path);
    ~TextReader();

    TextReader(const TextReader&) = delete;
    TextReader& operator=(const TextReader&) = delete;

    // Read one line without its trailing "\n" / "\r\n". Returns false on EOF.
    // Throws TableLoadError on a decompression error.
    bool readline(std::string& line);

    size_t line_number() const { return line_number_; }
    const std::string& path() const { return path_; }

private:
    gzFile gz_ = nullptr;
    std::string path_;
    size_t line_number_ = 0;
    std::vector<char> buffer_;
};

// Whole file, one entry per line
std::vector<std::string> read_lines(const std::string& path);

}  // namespace mhcbind
