#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "profile/histogram.hpp"
#include "profile/numeric_stats.hpp"
#include "sketch/hyperloglog.hpp"
#include "source/row.hpp"
#include "types/infer.hpp"

namespace colprof {

// What one pass must compute for one column.
struct column_plan {
    bool core      = true;   // completeness, type tally, distinct estimate
    bool histogram = false;
    bool numeric   = false;
    // Feed every non-null value to the numeric view and count failures as
    // skipped (predefined numeric type); otherwise only values that parse as
    // Integer or Fractional are fed.
    bool numeric_all_values = false;
};

// Aggregation state of one column over one partition (or, after merging, over
// any set of disjoint partitions). Holds no external resources, so states of
// an aborted pass can simply be dropped.
class column_state {
public:
    column_state(const column_plan& plan, unsigned hll_precision, std::size_t max_bins)
        : plan_(plan), distinct_(hll_precision) {
        if (plan.histogram) histogram_.emplace(max_bins);
        if (plan.numeric)   numeric_.emplace();
    }

    void add(cell v) {
        logical_type t = logical_type::null_;
        if (plan_.core) {
            ++total_;
            if (!v) return;
            ++non_null_;
            t = infer_type(v);
            tally_.add(t);
            distinct_.add(*v);
        } else {
            if (!v) return;
            if (numeric_ && !plan_.numeric_all_values) t = infer_type(v);
        }
        if (histogram_) histogram_->add(*v);
        if (numeric_) {
            if (plan_.numeric_all_values) numeric_->add_raw(*v);
            else if (is_numeric(t))       numeric_->add_raw(*v);
        }
    }

    // Folds a state built from a disjoint set of rows into this one.
    void merge(const column_state& o) {
        total_    += o.total_;
        non_null_ += o.non_null_;
        tally_.merge(o.tally_);
        distinct_.merge(o.distinct_);
        if (o.histogram_) {
            if (histogram_) histogram_->merge(*o.histogram_);
            else histogram_ = o.histogram_;
        }
        if (o.numeric_) {
            if (numeric_) numeric_->merge(*o.numeric_);
            else numeric_ = o.numeric_;
        }
    }

    std::uint64_t total_count() const { return total_; }
    std::uint64_t non_null_count() const { return non_null_; }
    const type_tally& tally() const { return tally_; }
    const hyperloglog& distinct() const { return distinct_; }
    const std::optional<value_histogram>& histogram() const { return histogram_; }
    const std::optional<numeric_stats>& numeric() const { return numeric_; }

private:
    column_plan   plan_;
    std::uint64_t total_    = 0;
    std::uint64_t non_null_ = 0;
    type_tally    tally_;
    hyperloglog   distinct_;
    std::optional<value_histogram> histogram_;
    std::optional<numeric_stats>   numeric_;
};

}
