#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "source/row.hpp"
#include "types/infer.hpp"
#include "util/errors.hpp"

namespace colprof {

enum class schedule_strategy {
    single_pass,  // histogram and numeric stats tracked speculatively in pass 1
    two_pass      // pass 2 only for columns that pass 1 shows need it
};

inline const char* to_string(schedule_strategy s) {
    return s == schedule_strategy::two_pass ? "two_pass" : "single_pass";
}

inline std::optional<schedule_strategy> parse_strategy(std::string_view s) {
    if (s == "single_pass" || s == "single") return schedule_strategy::single_pass;
    if (s == "two_pass" || s == "two")       return schedule_strategy::two_pass;
    return std::nullopt;
}

// Rows whose cell fails the predicate are not counted for that column.
using column_filter = std::function<bool(cell)>;

struct profiler_options {
    std::size_t low_cardinality_histogram_threshold = 120;
    // target relative standard error of the distinct estimate
    double distinct_estimator_precision = 0.05;
    std::optional<std::set<std::string>> restrict_to_columns;
    std::map<std::string, column_filter> column_filters;
    std::map<std::string, logical_type>  predefined_types;
    schedule_strategy strategy = schedule_strategy::single_pass;
    bool print_status_updates = false;

    void validate() const {
        if (low_cardinality_histogram_threshold == 0)
            throw config_error("low cardinality histogram threshold must be > 0");
        if (!(distinct_estimator_precision > 0.0) || !(distinct_estimator_precision < 1.0))
            throw config_error("distinct estimator precision must be in (0, 1)");
        for (const auto& [name, t] : predefined_types) {
            if (t == logical_type::null_)
                throw config_error("predefined type for column '" + name + "' cannot be Null");
        }
    }
};

}
