#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "util/errors.hpp"

namespace colprof {

// Sequential fixed-size block reads starting at a byte offset.
class chunk_reader {
public:
    chunk_reader(const std::filesystem::path& p, std::size_t chunk_bytes, std::uint64_t start = 0)
        : path_(p), buf_(chunk_bytes), offset_(start)
    {
        if (chunk_bytes == 0) throw std::invalid_argument("chunk_bytes == 0");
        in_.open(path_, std::ios::binary);
        if (!in_) throw input_error("failed to open file: " + path_.string());
        if (start > 0) {
            in_.seekg(static_cast<std::streamoff>(start));
            if (!in_) throw input_error("failed to seek in file: " + path_.string());
        }
    }

    // Returns a view of the next block and advances; empty at EOF. The view is
    // valid until the next call.
    std::string_view next() {
        if (!in_) return {};
        in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        const auto got = static_cast<std::size_t>(in_.gcount());
        if (in_.bad()) throw input_error("read error in file: " + path_.string());
        offset_ += got;
        return std::string_view(buf_.data(), got);
    }

    // Offset of the first byte the next call to next() returns.
    std::uint64_t offset() const { return offset_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    std::vector<char> buf_;
    std::uint64_t offset_;
};

}
