// src/csv/csv_source.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "io/chunk_reader.hpp"
#include "source/table_source.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include "util/nulls.hpp"

namespace colprof {

struct csv_options {
    char delimiter = ',';
    char quote     = '"';
    bool has_header = true;
    std::vector<std::string> null_tokens = default_null_tokens();
    std::size_t partition_rows = 65536;
    std::size_t chunk_bytes    = 262144;   // 256 KiB

    void validate() const {
        if (partition_rows == 0) throw config_error("partition rows must be > 0");
        if (chunk_bytes == 0)    throw config_error("chunk bytes must be > 0");
        if (delimiter == quote)  throw config_error("delimiter and quote must differ");
        auto line_char = [](char c) { return c == '\n' || c == '\r'; };
        if (line_char(delimiter) || line_char(quote))
            throw config_error("delimiter and quote cannot be line breaks");
    }
};

// ---------- record parser (RFC4180-ish) ----------
// Reads one record from sb: quoted fields, doubled quotes, line breaks inside
// quotes, LF / CRLF / CR terminators. Blank lines are skipped. Field text is
// stored back to back in buf, with ends[i] the end offset of field i.
// Returns false when no record is left.
inline bool read_csv_record(std::streambuf& sb, char delim, char quote,
                            std::string& buf, std::vector<std::size_t>& ends) {
    using traits = std::char_traits<char>;
    buf.clear();
    ends.clear();
    bool in_quotes = false;
    bool any = false;
    for (;;) {
        const int ci = sb.sbumpc();
        if (traits::eq_int_type(ci, traits::eof())) {
            if (!any) return false;
            break;   // last record without a terminator (or an unclosed quote)
        }
        const char c = traits::to_char_type(ci);
        if (in_quotes) {
            if (c == quote) {
                if (traits::eq_int_type(sb.sgetc(), traits::to_int_type(quote))) {
                    sb.sbumpc();
                    buf.push_back(quote);
                } else {
                    in_quotes = false;
                }
            } else {
                buf.push_back(c);
            }
            continue;
        }
        if (c == quote) { in_quotes = true; any = true; continue; }
        if (c == delim) { ends.push_back(buf.size()); any = true; continue; }
        if (c == '\n' || c == '\r') {
            if (!any) continue;
            break;
        }
        buf.push_back(c);
        any = true;
    }
    ends.push_back(buf.size());
    return true;
}

// A CSV file exposed as partitions of `partition_rows` records each.
//
// Construction reads the header and makes one chunked pass over the file to
// record the byte offset where every partition starts; the quote tracking in
// that pass agrees with read_csv_record() on record boundaries. Each
// partition cursor opens its own stream, so partitions can be scanned in
// parallel.
class csv_source : public table_source {
public:
    csv_source(std::filesystem::path path, csv_options opts)
        : path_(std::move(path)), opts_(std::move(opts)) {
        opts_.validate();
        read_header();
        index_partitions();
        log_debug("{}: {} column(s), {} row(s), {} partition(s)",
                  path_.string(), columns_.size(), rows_, offsets_.size());
    }

    std::vector<std::string> column_names() const override { return columns_; }
    std::size_t partition_count() const override { return offsets_.size(); }
    std::unique_ptr<partition_cursor> open_partition(std::size_t index) const override {
        if (index >= offsets_.size()) throw std::out_of_range("partition index out of range");
        return std::make_unique<cursor>(*this, offsets_[index], counts_[index]);
    }

    std::uint64_t rows() const { return rows_; }
    const std::filesystem::path& path() const { return path_; }

private:
    class cursor : public partition_cursor {
    public:
        cursor(const csv_source& src, std::uint64_t offset, std::uint64_t rows)
            : src_(src), remaining_(rows) {
            in_.open(src.path_, std::ios::binary);
            if (!in_) throw input_error("failed to open file: " + src.path_.string());
            in_.seekg(static_cast<std::streamoff>(offset));
            if (!in_) throw input_error("failed to seek in file: " + src.path_.string());
        }

        const std::vector<std::string>& columns() const override { return src_.columns_; }

        bool next(row_view& row) override {
            if (remaining_ == 0) return false;
            if (!read_csv_record(*in_.rdbuf(), src_.opts_.delimiter, src_.opts_.quote, buf_, ends_)) {
                throw input_error("unexpected end of file in " + src_.path_.string());
            }
            --remaining_;
            const std::size_t width = src_.columns_.size();
            row.clear();
            std::size_t begin = 0;
            for (std::size_t i = 0; i < width; ++i) {
                if (i >= ends_.size()) { row.push(std::nullopt); continue; }
                const std::string_view field(buf_.data() + begin, ends_[i] - begin);
                row.push(to_cell(field, src_.opts_.null_tokens));
                begin = ends_[i];
            }
            return true;
        }

    private:
        const csv_source& src_;
        std::ifstream in_;
        std::uint64_t remaining_;
        std::string buf_;
        std::vector<std::size_t> ends_;
    };

    void read_header() {
        std::ifstream in(path_, std::ios::binary);
        if (!in) throw input_error("failed to open file: " + path_.string());

        // skip a UTF-8 byte order mark
        char bom[3] = {0, 0, 0};
        in.read(bom, 3);
        if (in.gcount() == 3 && bom[0] == '\xEF' && bom[1] == '\xBB' && bom[2] == '\xBF') data_start_ = 3;
        in.clear();
        in.seekg(static_cast<std::streamoff>(data_start_));

        std::string buf;
        std::vector<std::size_t> ends;
        if (!read_csv_record(*in.rdbuf(), opts_.delimiter, opts_.quote, buf, ends)) return;  // empty file

        std::size_t begin = 0;
        for (std::size_t i = 0; i < ends.size(); ++i) {
            std::string name = opts_.has_header ? buf.substr(begin, ends[i] - begin) : std::string{};
            if (name.empty()) name = "col" + std::to_string(i + 1);
            // profiles are keyed by name, so a repeated header gets a suffix
            if (std::find(columns_.begin(), columns_.end(), name) != columns_.end()) {
                log_warn("duplicate column '{}' renamed to '{}_{}'", name, name, i + 1);
                name += "_" + std::to_string(i + 1);
            }
            columns_.push_back(std::move(name));
            begin = ends[i];
        }
        if (opts_.has_header) {
            const auto pos = in.tellg();
            if (pos < 0) throw input_error("failed to read header of " + path_.string());
            data_start_ = static_cast<std::uint64_t>(pos);
        }
    }

    void index_partitions() {
        if (columns_.empty()) return;
        chunk_reader reader(path_, opts_.chunk_bytes, data_start_);
        bool in_quotes = false;
        bool has_data = false;
        std::uint64_t record_start = data_start_;

        auto end_record = [&]() {
            if (rows_ % opts_.partition_rows == 0) {
                offsets_.push_back(record_start);
                counts_.push_back(0);
            }
            ++counts_.back();
            ++rows_;
        };

        for (;;) {
            const std::uint64_t base = reader.offset();
            const std::string_view chunk = reader.next();
            if (chunk.empty()) break;
            for (std::size_t i = 0; i < chunk.size(); ++i) {
                const char c = chunk[i];
                if (c == opts_.quote) {
                    in_quotes = !in_quotes;   // a doubled quote toggles twice
                    has_data = true;
                } else if (!in_quotes && (c == '\n' || c == '\r')) {
                    if (has_data) end_record();
                    has_data = false;
                    record_start = base + i + 1;
                } else {
                    has_data = true;
                }
            }
        }
        if (has_data) end_record();
    }

    std::filesystem::path path_;
    csv_options opts_;
    std::vector<std::string> columns_;
    std::uint64_t data_start_ = 0;
    std::uint64_t rows_ = 0;
    std::vector<std::uint64_t> offsets_;  // first byte of each partition
    std::vector<std::uint64_t> counts_;   // records per partition
};

}
