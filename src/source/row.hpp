#pragma once
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace colprof {

using cell = std::optional<std::string_view>;

// One row of a partition, positionally aligned with the partition's column
// list. Views stay valid until the cursor is advanced.
struct row_view {
    std::vector<cell> fields;

    std::size_t size() const noexcept { return fields.size(); }
    cell operator[](std::size_t i) const noexcept { return i < fields.size() ? fields[i] : std::nullopt; }
    void clear() noexcept { fields.clear(); }
    void push(cell c) { fields.push_back(c); }
};

}
