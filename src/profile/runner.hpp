#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "exec/executor.hpp"
#include "metrics/timers.hpp"
#include "profile/column_state.hpp"
#include "profile/options.hpp"
#include "profile/profile.hpp"
#include "profile/scheduler.hpp"
#include "sketch/hyperloglog.hpp"
#include "source/table_source.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

namespace colprof {

// Builds the immutable profile of one column from its fully merged state.
inline ColumnProfile make_profile(const std::string& name,
                                  const column_state& s,
                                  std::optional<logical_type> predefined) {
    ColumnProfile p;
    p.column         = name;
    p.total_count    = s.total_count();
    p.non_null_count = s.non_null_count();
    p.completeness   = s.total_count() > 0
        ? static_cast<double>(s.non_null_count()) / static_cast<double>(s.total_count()) : 0.0;
    // dense estimates can overshoot slightly; more distinct values than
    // values is never a sound answer
    p.approx_num_distinct   = std::min(s.distinct().estimate(), s.non_null_count());
    p.type_counts           = s.tally();
    p.is_data_type_inferred = !predefined.has_value();
    p.data_type             = predefined ? *predefined : resolve_dominant(s.tally());
    if (s.non_null_count() == 0) return p;
    if (s.histogram()) p.histogram = s.histogram()->finish(s.non_null_count());
    if (s.numeric() && is_numeric(p.data_type)) p.numeric = s.numeric()->finish();
    return p;
}

// Public entry point: profiles every column of a table_source (or the
// allow-listed subset) in at most two scans.
//
// Partition results are folded in partition-index order, so a run is
// deterministic for a fixed partitioning. Distinct estimates can differ across
// partitionings only within the sketch's error bound; exact statistics do
// not differ, apart from floating-point summation order in numeric sums.
class column_profiler_runner {
public:
    explicit column_profiler_runner(profiler_options opts = {},
                                    std::shared_ptr<execution_engine> engine = nullptr)
        : opts_(std::move(opts)),
          engine_(engine ? std::move(engine) : std::make_shared<sequential_engine>()) {
        opts_.validate();
        hll_precision_ = hyperloglog::precision_for_error(opts_.distinct_estimator_precision);
    }

    const profiler_options& options() const { return opts_; }

    ColumnProfiles run(const table_source& source) const {
        const std::vector<std::string> columns = target_columns(source);
        profile_scheduler scheduler(opts_, columns);

        std::vector<column_filter> filters;
        filters.reserve(columns.size());
        for (const auto& c : columns) {
            auto it = opts_.column_filters.find(c);
            filters.push_back(it != opts_.column_filters.end() ? it->second : column_filter{});
        }

        auto profiled = [&](const std::string& c) {
            return std::find(columns.begin(), columns.end(), c) != columns.end();
        };
        for (const auto& kv : opts_.column_filters)
            if (!profiled(kv.first)) log_warn("filter for column '{}' ignored: column not profiled", kv.first);
        for (const auto& kv : opts_.predefined_types)
            if (!profiled(kv.first)) log_warn("type for column '{}' ignored: column not profiled", kv.first);

        status("profiling {} column(s) over {} partition(s), strategy {}, engine {}",
               columns.size(), source.partition_count(), to_string(scheduler.strategy()), engine_->name());

        ColumnProfiles out;
        out.strategy = scheduler.strategy();

        std::uint64_t records = 0;
        std::vector<column_state> merged = run_pass(source, columns, scheduler.first_pass(), filters, 1, records);
        out.passes = 1;
        if (auto second = scheduler.second_pass(merged)) {
            std::uint64_t rescanned = 0;
            std::vector<column_state> extra = run_pass(source, columns, *second, filters, 2, rescanned);
            if (rescanned != records)
                log_warn("source changed between passes: {} row(s) in pass 1, {} in pass 2", records, rescanned);
            for (std::size_t i = 0; i < merged.size(); ++i) merged[i].merge(extra[i]);
            out.passes = 2;
        } else if (scheduler.strategy() == schedule_strategy::two_pass) {
            status("second pass not needed");
        }

        out.num_records = records;
        out.columns = columns;
        for (std::size_t i = 0; i < columns.size(); ++i) {
            out.profiles.emplace(columns[i], make_profile(columns[i], merged[i], scheduler.predefined(i)));
            const ColumnProfile& p = out.profiles.at(columns[i]);
            if (merged[i].histogram() && merged[i].histogram()->overflowed())
                log_debug("column '{}': more than {} distinct values, histogram dropped",
                          columns[i], merged[i].histogram()->max_bins());
            if (p.numeric && p.numeric->skipped > 0)
                log_warn("column '{}': {} value(s) not numeric, excluded from numeric statistics",
                         columns[i], p.numeric->skipped);
        }
        return out;
    }

private:
    template <typename... Args>
    void status(std::string_view f, Args&&... args) const {
        log_at(opts_.print_status_updates ? log_level::info : log_level::debug, f, std::forward<Args>(args)...);
    }

    std::vector<std::string> target_columns(const table_source& source) const {
        std::vector<std::string> all = source.column_names();
        if (all.empty()) throw input_error("data source has no columns");
        if (!opts_.restrict_to_columns) return all;

        for (const auto& c : *opts_.restrict_to_columns) {
            if (std::find(all.begin(), all.end(), c) == all.end())
                throw input_error("unknown column '" + c + "' in column restriction");
        }
        std::vector<std::string> out;
        for (const auto& c : all) {
            if (opts_.restrict_to_columns->count(c)) out.push_back(c);
        }
        if (out.empty()) throw input_error("column restriction selects no columns");
        return out;
    }

    std::vector<column_state> empty_states(const std::vector<column_plan>& plans) const {
        std::vector<column_state> states;
        states.reserve(plans.size());
        for (const auto& plan : plans)
            states.emplace_back(plan, hll_precision_, opts_.low_cardinality_histogram_threshold);
        return states;
    }

    std::vector<column_state> run_pass(const table_source& source,
                                       const std::vector<std::string>& columns,
                                       const std::vector<column_plan>& plans,
                                       const std::vector<column_filter>& filters,
                                       unsigned pass,
                                       std::uint64_t& records) const {
        wall_timer timer;
        status("pass {} started", pass);

        constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();
        partition_scan scan = [&](partition_cursor& cursor) {
            partition_result r;
            r.columns = empty_states(plans);
            // profiled column -> position in this partition's rows
            std::vector<std::size_t> pos(columns.size(), npos);
            const auto& present = cursor.columns();
            for (std::size_t i = 0; i < columns.size(); ++i) {
                auto it = std::find(present.begin(), present.end(), columns[i]);
                if (it != present.end()) pos[i] = static_cast<std::size_t>(it - present.begin());
                else log_debug("column '{}' missing from a partition, counted as nulls", columns[i]);
            }
            row_view row;
            while (cursor.next(row)) {
                ++r.rows;
                for (std::size_t i = 0; i < columns.size(); ++i) {
                    const cell v = pos[i] == npos ? cell{} : row[pos[i]];
                    if (filters[i] && !filters[i](v)) continue;
                    r.columns[i].add(v);
                }
            }
            return r;
        };

        std::vector<partition_result> parts = engine_->run_pass(source, scan);

        // linear fold in partition order
        std::vector<column_state> merged = empty_states(plans);
        records = 0;
        for (const auto& part : parts) {
            records += part.rows;
            for (std::size_t i = 0; i < merged.size(); ++i) merged[i].merge(part.columns[i]);
        }
        timer.stop();
        status("pass {} finished: {} row(s) in {:.1f} ms", pass, records, timer.ms());
        return merged;
    }

    profiler_options opts_;
    std::shared_ptr<execution_engine> engine_;
    unsigned hll_precision_ = hyperloglog::kDefaultPrecision;
};

}
