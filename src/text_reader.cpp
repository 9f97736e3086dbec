#include "mhcbind/text_reader.hpp"
#include "mhcbind/errors.hpp"

#include <cstring>

namespace mhcbind {

TextReader::TextReader(const std::string& path) : path_(path), buffer_(64 * 1024) {
    gz_ = gzopen(path.c_str(), "rb");
    if (!gz_) {
        throw TableLoadError("Cannot open file: " + path);
    }
    gzbuffer(gz_, GZBUF_SIZE);
}

TextReader::~TextReader() {
    if (gz_) gzclose(gz_);
}

bool TextReader::readline(std::string& line) {
    line.clear();
    bool got_any = false;

    while (gzgets(gz_, buffer_.data(), static_cast<int>(buffer_.size())) != nullptr) {
        got_any = true;
        const size_t len = std::strlen(buffer_.data());
        line.append(buffer_.data(), len);
        if (len > 0 && buffer_[len - 1] == '\n') break;
    }

    if (!got_any) {
        int errnum = 0;
        const char* msg = gzerror(gz_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw TableLoadError("Read error in " + path_ + ": " + (msg ? msg : "unknown zlib error"));
        }
        return false;
    }

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    ++line_number_;
    return true;
}

std::vector<std::string> read_lines(const std::string& path) {
    TextReader reader(path);
    std::vector<std::string> lines;
    std::string line;
    while (reader.readline(line)) lines.push_back(line);
    return lines;
}

}  // namespace mhcbind
