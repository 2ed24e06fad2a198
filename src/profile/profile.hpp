#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "profile/histogram.hpp"
#include "profile/numeric_stats.hpp"
#include "profile/options.hpp"
#include "types/infer.hpp"

namespace colprof {

// ---------- data model ----------
struct ColumnProfile {
    std::string   column;
    double        completeness = 0.0;     // non_null_count / total_count, 0 when no rows
    std::uint64_t approx_num_distinct = 0;
    logical_type  data_type = logical_type::string_;
    bool          is_data_type_inferred = true;
    type_tally    type_counts;
    std::uint64_t total_count = 0;
    std::uint64_t non_null_count = 0;

    // absent when the column overflowed the histogram bound (or has no values)
    std::optional<std::vector<HistogramEntry>> histogram;
    // present only for Integer/Fractional columns with at least one number
    std::optional<NumericProfile> numeric;
};

struct ColumnProfiles {
    std::map<std::string, ColumnProfile> profiles;
    std::vector<std::string> columns;  // profiled columns in source order
    std::uint64_t num_records = 0;
    unsigned      passes = 0;          // full scans performed
    schedule_strategy strategy = schedule_strategy::single_pass;

    const ColumnProfile& at(const std::string& name) const {
        auto it = profiles.find(name);
        if (it == profiles.end()) throw std::out_of_range("no profile for column '" + name + "'");
        return it->second;
    }
    bool contains(const std::string& name) const { return profiles.count(name) > 0; }
    std::size_t size() const { return profiles.size(); }
};

}
