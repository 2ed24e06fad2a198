#pragma once
#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "source/table_source.hpp"

namespace colprof {

using owned_row = std::vector<std::optional<std::string>>;

// Partitions held in memory. Each partition carries its own column list, so
// a column can be missing from some of them.
class memory_table : public table_source {
public:
    struct partition {
        std::vector<std::string> columns;
        std::vector<owned_row>   rows;
    };

    memory_table() = default;
    explicit memory_table(std::vector<std::string> columns) : columns_(std::move(columns)) {}

    memory_table& add_partition(std::vector<owned_row> rows) {
        return add_partition(columns_, std::move(rows));
    }

    memory_table& add_partition(std::vector<std::string> columns, std::vector<owned_row> rows) {
        for (const auto& r : rows) {
            if (r.size() != columns.size())
                throw std::invalid_argument("row width does not match partition columns");
        }
        for (const auto& c : columns) {
            if (std::find(columns_.begin(), columns_.end(), c) == columns_.end()) columns_.push_back(c);
        }
        partitions_.push_back(partition{std::move(columns), std::move(rows)});
        return *this;
    }

    // Contiguous split of rows into n partitions (the last ones may be empty).
    static memory_table split(const std::vector<std::string>& columns,
                              const std::vector<owned_row>& rows,
                              std::size_t n) {
        if (n == 0) throw std::invalid_argument("partition count must be > 0");
        memory_table t(columns);
        const std::size_t per = (rows.size() + n - 1) / n;
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t lo = std::min(rows.size(), i * per);
            const std::size_t hi = std::min(rows.size(), lo + per);
            t.add_partition(std::vector<owned_row>(rows.begin() + lo, rows.begin() + hi));
        }
        return t;
    }

    std::vector<std::string> column_names() const override { return columns_; }
    std::size_t partition_count() const override { return partitions_.size(); }

    std::unique_ptr<partition_cursor> open_partition(std::size_t index) const override {
        if (index >= partitions_.size()) throw std::out_of_range("partition index out of range");
        return std::make_unique<cursor>(partitions_[index]);
    }

private:
    class cursor : public partition_cursor {
    public:
        explicit cursor(const partition& p) : p_(p) {}

        const std::vector<std::string>& columns() const override { return p_.columns; }

        bool next(row_view& row) override {
            if (pos_ >= p_.rows.size()) return false;
            row.clear();
            for (const auto& v : p_.rows[pos_]) {
                if (v) row.push(std::string_view(*v));
                else row.push(std::nullopt);
            }
            ++pos_;
            return true;
        }

    private:
        const partition& p_;
        std::size_t pos_ = 0;
    };

    std::vector<std::string> columns_;
    std::vector<partition>   partitions_;
};

}
