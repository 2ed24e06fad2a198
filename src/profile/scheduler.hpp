#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "profile/column_state.hpp"
#include "profile/options.hpp"
#include "types/infer.hpp"

namespace colprof {

// Decides which accumulators every pass needs, per column.
//
// single_pass: one scan computes everything; the histogram is tracked
// speculatively under its bound and numeric stats for whatever parses as a
// number, and finalization drops what the resolved type does not use.
//
// two_pass: the first scan computes completeness, the type tally and the
// distinct estimate only. A second scan runs when at least one column may fit
// the histogram threshold or resolves to a numeric type, and only for the
// accumulators those columns need.
class profile_scheduler {
public:
    profile_scheduler(const profiler_options& opts, std::vector<std::string> columns)
        : strategy_(opts.strategy),
          threshold_(opts.low_cardinality_histogram_threshold),
          columns_(std::move(columns)) {
        predefined_.reserve(columns_.size());
        for (const auto& c : columns_) {
            auto it = opts.predefined_types.find(c);
            if (it != opts.predefined_types.end()) predefined_.push_back(it->second);
            else predefined_.push_back(std::nullopt);
        }
    }

    schedule_strategy strategy() const { return strategy_; }
    unsigned max_passes() const { return strategy_ == schedule_strategy::two_pass ? 2 : 1; }
    const std::vector<std::string>& columns() const { return columns_; }
    std::optional<logical_type> predefined(std::size_t i) const { return predefined_[i]; }

    std::vector<column_plan> first_pass() const {
        std::vector<column_plan> plans(columns_.size());
        if (strategy_ == schedule_strategy::two_pass) return plans;
        for (std::size_t i = 0; i < plans.size(); ++i) {
            plans[i].histogram = true;
            numeric_plan(i, plans[i]);
        }
        return plans;
    }

    // nullopt when pass 1 already produced everything
    std::optional<std::vector<column_plan>> second_pass(const std::vector<column_state>& merged) const {
        if (strategy_ != schedule_strategy::two_pass) return std::nullopt;
        std::vector<column_plan> plans(columns_.size());
        bool needed = false;
        for (std::size_t i = 0; i < plans.size(); ++i) {
            const column_state& s = merged[i];
            plans[i].core = false;
            if (s.non_null_count() == 0) continue;
            plans[i].histogram = may_fit_histogram(s);
            if (is_numeric(resolved_type(i, s))) numeric_plan(i, plans[i]);
            needed = needed || plans[i].histogram || plans[i].numeric;
        }
        if (!needed) return std::nullopt;
        return plans;
    }

    logical_type resolved_type(std::size_t i, const column_state& s) const {
        return predefined_[i] ? *predefined_[i] : resolve_dominant(s.tally());
    }

    // A dense estimate can overshoot the exact distinct count, so the gate
    // allows three standard errors of slack over the threshold; the histogram
    // itself enforces the exact bound.
    bool may_fit_histogram(const column_state& s) const {
        const std::uint64_t est = std::min(s.distinct().estimate(), s.non_null_count());
        const double limit = static_cast<double>(threshold_) * (1.0 + 3.0 * s.distinct().standard_error());
        return static_cast<double>(est) <= limit;
    }

private:
    void numeric_plan(std::size_t i, column_plan& plan) const {
        if (!predefined_[i]) {
            plan.numeric = true;
        } else if (is_numeric(*predefined_[i])) {
            plan.numeric = true;
            plan.numeric_all_values = true;
        }
    }

    schedule_strategy strategy_;
    std::size_t threshold_;
    std::vector<std::string> columns_;
    std::vector<std::optional<logical_type>> predefined_;
};

}
