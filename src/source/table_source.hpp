#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "source/row.hpp"

namespace colprof {

// Lazy row sequence of a single partition.
class partition_cursor {
public:
    virtual ~partition_cursor() = default;

    // Columns present in this partition; may be a subset of the table's.
    virtual const std::vector<std::string>& columns() const = 0;

    // Fills row and returns true, or returns false at the end of the partition.
    virtual bool next(row_view& row) = 0;
};

// Partitioned tabular input. Implementations must allow open_partition() to
// be called concurrently for different indices.
class table_source {
public:
    virtual ~table_source() = default;

    // Union of all partition schemas, in first-seen order.
    virtual std::vector<std::string> column_names() const = 0;
    virtual std::size_t partition_count() const = 0;
    virtual std::unique_ptr<partition_cursor> open_partition(std::size_t index) const = 0;
};

}
