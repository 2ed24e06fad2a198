#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "exec/executor.hpp"
#include "profile/runner.hpp"
#include "source/memory_table.hpp"
#include "test_util.hpp"

using colprof::ColumnProfile;
using colprof::ColumnProfiles;
using colprof::column_profiler_runner;
using colprof::logical_type;
using colprof::memory_table;
using colprof::owned_row;
using colprof::profiler_options;
using colprof::schedule_strategy;
using colprof_test::na;
using colprof_test::reference_table;
using colprof_test::v;

namespace {

std::shared_ptr<colprof::execution_engine> make_engine(bool parallel) {
    if (parallel) return std::make_shared<colprof::async_engine>(3);
    return std::make_shared<colprof::sequential_engine>();
}

ColumnProfiles profile(const colprof::table_source& src, profiler_options opts = {}, bool parallel = false) {
    const column_profiler_runner runner(std::move(opts), make_engine(parallel));
    return runner.run(src);
}

}

// ============================================================================
// Reference dataset under every strategy / engine / partitioning
// ============================================================================

class ReferenceDatasetTest
    : public ::testing::TestWithParam<std::tuple<schedule_strategy, bool, std::size_t>> {
protected:
    ColumnProfiles run() const {
        const auto [strategy, parallel, partitions] = GetParam();
        profiler_options opts;
        opts.strategy = strategy;
        return profile(reference_table(partitions), opts, parallel);
    }
};

TEST_P(ReferenceDatasetTest, TotalNumber) {
    const ColumnProfiles res = run();
    EXPECT_EQ(res.num_records, 8u);
    const ColumnProfile& p = res.at("totalNumber");
    EXPECT_DOUBLE_EQ(p.completeness, 0.75);
    EXPECT_EQ(p.data_type, logical_type::fractional_);
    EXPECT_TRUE(p.is_data_type_inferred);
    EXPECT_EQ(p.total_count, 8u);
    EXPECT_EQ(p.non_null_count, 6u);
    EXPECT_EQ(p.approx_num_distinct, 5u);
    EXPECT_EQ(p.type_counts[logical_type::integer_], 3u);
    EXPECT_EQ(p.type_counts[logical_type::fractional_], 3u);

    ASSERT_TRUE(p.numeric.has_value());
    EXPECT_DOUBLE_EQ(p.numeric->minimum, 1.0);
    EXPECT_DOUBLE_EQ(p.numeric->maximum, 20.0);
    EXPECT_NEAR(p.numeric->mean, 11.0, 1e-9);
    EXPECT_NEAR(p.numeric->std_dev, 7.28, 0.005);
    EXPECT_EQ(p.numeric->count, 6u);
}

TEST_P(ReferenceDatasetTest, Status) {
    const ColumnProfiles res = run();
    const ColumnProfile& p = res.at("status");
    EXPECT_DOUBLE_EQ(p.completeness, 1.0);
    EXPECT_EQ(p.data_type, logical_type::string_);
    EXPECT_EQ(p.approx_num_distinct, 3u);
    EXPECT_FALSE(p.numeric.has_value());

    ASSERT_TRUE(p.histogram.has_value());
    ASSERT_EQ(p.histogram->size(), 3u);
    EXPECT_EQ((*p.histogram)[0].value, "DELAYED");
    EXPECT_EQ((*p.histogram)[0].count, 4u);
    EXPECT_DOUBLE_EQ((*p.histogram)[0].ratio, 0.5);
    EXPECT_EQ((*p.histogram)[1].value, "IN_TRANSIT");
    EXPECT_DOUBLE_EQ((*p.histogram)[1].ratio, 0.25);
    EXPECT_EQ((*p.histogram)[2].value, "UNKNOWN");
    EXPECT_DOUBLE_EQ((*p.histogram)[2].ratio, 0.25);
}

TEST_P(ReferenceDatasetTest, Valuable) {
    const ColumnProfiles res = run();
    const ColumnProfile& p = res.at("valuable");
    EXPECT_DOUBLE_EQ(p.completeness, 0.625);
    EXPECT_EQ(p.data_type, logical_type::boolean_);
    EXPECT_EQ(p.approx_num_distinct, 2u);
    EXPECT_FALSE(p.numeric.has_value());
    ASSERT_TRUE(p.histogram.has_value());
    ASSERT_EQ(p.histogram->size(), 2u);
    EXPECT_EQ((*p.histogram)[0].value, "false");
    EXPECT_EQ((*p.histogram)[0].count, 3u);
    EXPECT_EQ((*p.histogram)[1].value, "true");
}

TEST_P(ReferenceDatasetTest, ProductName) {
    const ColumnProfiles res = run();
    const ColumnProfile& p = res.at("productName");
    EXPECT_DOUBLE_EQ(p.completeness, 1.0);
    EXPECT_EQ(p.data_type, logical_type::string_);
    EXPECT_EQ(p.approx_num_distinct, 5u);
    ASSERT_TRUE(p.histogram.has_value());
    EXPECT_EQ((*p.histogram)[0].value, "thingC");
    EXPECT_EQ((*p.histogram)[0].count, 3u);
}

TEST_P(ReferenceDatasetTest, PassesAndColumnOrder) {
    const auto [strategy, parallel, partitions] = GetParam();
    const ColumnProfiles res = run();
    EXPECT_EQ(res.strategy, strategy);
    EXPECT_EQ(res.passes, strategy == schedule_strategy::two_pass ? 2u : 1u);
    EXPECT_EQ(res.columns, colprof_test::reference_columns());
    EXPECT_EQ(res.size(), 4u);
}

INSTANTIATE_TEST_SUITE_P(
    AllModes, ReferenceDatasetTest,
    ::testing::Combine(::testing::Values(schedule_strategy::single_pass, schedule_strategy::two_pass),
                       ::testing::Bool(),
                       ::testing::Values(std::size_t{1}, std::size_t{3}, std::size_t{8}, std::size_t{11})));

// ============================================================================
// Histogram bound
// ============================================================================

class OverflowTest : public ::testing::TestWithParam<schedule_strategy> {};

TEST_P(OverflowTest, LowThresholdDropsWiderHistograms) {
    profiler_options opts;
    opts.strategy = GetParam();
    opts.low_cardinality_histogram_threshold = 2;
    const ColumnProfiles res = profile(reference_table(3), opts);
    EXPECT_FALSE(res.at("status").histogram.has_value());
    EXPECT_FALSE(res.at("productName").histogram.has_value());
    EXPECT_TRUE(res.at("valuable").histogram.has_value());
    // the bound does not affect the other statistics
    EXPECT_EQ(res.at("status").approx_num_distinct, 3u);
    EXPECT_TRUE(res.at("totalNumber").numeric.has_value());
}

TEST_P(OverflowTest, HighCardinalityColumn) {
    std::vector<owned_row> rows;
    for (int i = 0; i < 5000; ++i) rows.push_back({std::to_string(i), std::string(i % 2 ? "x" : "y")});
    const auto table = memory_table::split({"id", "flag"}, rows, 6);

    profiler_options opts;
    opts.strategy = GetParam();
    const ColumnProfiles res = profile(table, opts, true);

    const ColumnProfile& id = res.at("id");
    EXPECT_FALSE(id.histogram.has_value());
    EXPECT_EQ(id.data_type, logical_type::integer_);
    EXPECT_NEAR(static_cast<double>(id.approx_num_distinct), 5000.0, 5000.0 * 0.2);
    ASSERT_TRUE(id.numeric.has_value());
    EXPECT_DOUBLE_EQ(id.numeric->minimum, 0.0);
    EXPECT_DOUBLE_EQ(id.numeric->maximum, 4999.0);

    const ColumnProfile& flag = res.at("flag");
    ASSERT_TRUE(flag.histogram.has_value());
    EXPECT_EQ(flag.histogram->size(), 2u);
}

INSTANTIATE_TEST_SUITE_P(BothStrategies, OverflowTest,
                         ::testing::Values(schedule_strategy::single_pass, schedule_strategy::two_pass));

// ============================================================================
// Edge cases
// ============================================================================

TEST(RunnerTest, RestrictToColumns) {
    profiler_options opts;
    opts.restrict_to_columns = std::set<std::string>{"status", "valuable"};
    const ColumnProfiles res = profile(reference_table(2), opts);
    EXPECT_EQ(res.size(), 2u);
    EXPECT_TRUE(res.contains("status"));
    EXPECT_FALSE(res.contains("productName"));
    EXPECT_EQ(res.columns, (std::vector<std::string>{"status", "valuable"}));
    EXPECT_THROW(res.at("productName"), std::out_of_range);
}

TEST(RunnerTest, UnknownRestrictedColumnThrows) {
    profiler_options opts;
    opts.restrict_to_columns = std::set<std::string>{"status", "nope"};
    EXPECT_THROW(profile(reference_table(), opts), colprof::input_error);
}

TEST(RunnerTest, EmptyRestrictionThrows) {
    profiler_options opts;
    opts.restrict_to_columns = std::set<std::string>{};
    EXPECT_THROW(profile(reference_table(), opts), colprof::input_error);
}

TEST(RunnerTest, SourceWithoutColumnsThrows) {
    const memory_table empty;
    EXPECT_THROW(profile(empty), colprof::input_error);
}

TEST(RunnerTest, InvalidOptionsThrowAtConstruction) {
    profiler_options opts;
    opts.distinct_estimator_precision = 1.5;
    EXPECT_THROW(column_profiler_runner{opts}, colprof::config_error);
}

TEST(RunnerTest, NoRows) {
    const memory_table table({"a", "b"});
    const ColumnProfiles res = profile(table);
    EXPECT_EQ(res.num_records, 0u);
    const ColumnProfile& a = res.at("a");
    EXPECT_EQ(a.completeness, 0.0);
    EXPECT_EQ(a.approx_num_distinct, 0u);
    EXPECT_FALSE(a.histogram.has_value());
    EXPECT_FALSE(a.numeric.has_value());
}

TEST(RunnerTest, AllNullColumn) {
    memory_table table({"a", "b"});
    table.add_partition({{v("1"), na()}, {v("2"), na()}, {v("3"), na()}});
    for (auto strategy : {schedule_strategy::single_pass, schedule_strategy::two_pass}) {
        profiler_options opts;
        opts.strategy = strategy;
        const ColumnProfiles res = profile(table, opts);
        const ColumnProfile& b = res.at("b");
        EXPECT_EQ(b.total_count, 3u);
        EXPECT_EQ(b.completeness, 0.0);
        EXPECT_EQ(b.data_type, logical_type::string_);
        EXPECT_EQ(b.approx_num_distinct, 0u);
        EXPECT_FALSE(b.histogram.has_value());
        EXPECT_FALSE(b.numeric.has_value());
    }
}

TEST(RunnerTest, ColumnMissingFromPartitionCountsAsNull) {
    memory_table table;
    table.add_partition({"a"}, {{v("x")}, {v("y")}});
    table.add_partition({"b", "a"}, {{v("1"), v("x")}, {v("2"), na()}});
    const ColumnProfiles res = profile(table, {}, true);

    EXPECT_EQ(res.columns, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(res.num_records, 4u);

    const ColumnProfile& a = res.at("a");
    EXPECT_EQ(a.non_null_count, 3u);
    EXPECT_DOUBLE_EQ(a.completeness, 0.75);

    const ColumnProfile& b = res.at("b");
    EXPECT_EQ(b.total_count, 4u);
    EXPECT_EQ(b.non_null_count, 2u);
    EXPECT_DOUBLE_EQ(b.completeness, 0.5);
    EXPECT_EQ(b.data_type, logical_type::integer_);
}

TEST(RunnerTest, ColumnFilterSkipsRows) {
    profiler_options opts;
    opts.column_filters["totalNumber"] = [](colprof::cell c) { return c && *c != "20"; };
    opts.column_filters["notAColumn"] = [](colprof::cell) { return false; };
    const ColumnProfiles res = profile(reference_table(2), opts);

    const ColumnProfile& p = res.at("totalNumber");
    EXPECT_EQ(p.total_count, 4u);
    EXPECT_DOUBLE_EQ(p.completeness, 1.0);
    ASSERT_TRUE(p.numeric.has_value());
    EXPECT_DOUBLE_EQ(p.numeric->maximum, 13.0);
    // other columns see every row
    EXPECT_EQ(res.at("status").total_count, 8u);
    EXPECT_EQ(res.num_records, 8u);
}

TEST(RunnerTest, PredefinedTypes) {
    for (auto strategy : {schedule_strategy::single_pass, schedule_strategy::two_pass}) {
        profiler_options opts;
        opts.strategy = strategy;
        opts.predefined_types["valuable"] = logical_type::string_;
        opts.predefined_types["totalNumber"] = logical_type::integer_;
        opts.predefined_types["status"] = logical_type::fractional_;
        const ColumnProfiles res = profile(reference_table(3), opts);

        const ColumnProfile& valuable = res.at("valuable");
        EXPECT_EQ(valuable.data_type, logical_type::string_);
        EXPECT_FALSE(valuable.is_data_type_inferred);

        const ColumnProfile& total = res.at("totalNumber");
        EXPECT_EQ(total.data_type, logical_type::integer_);
        ASSERT_TRUE(total.numeric.has_value());
        EXPECT_EQ(total.numeric->count, 6u);
        EXPECT_NEAR(total.numeric->mean, 11.0, 1e-9);

        // nothing in status parses as a number
        const ColumnProfile& status = res.at("status");
        EXPECT_EQ(status.data_type, logical_type::fractional_);
        EXPECT_FALSE(status.numeric.has_value());

        EXPECT_TRUE(res.at("productName").is_data_type_inferred);
    }
}

TEST(RunnerTest, PredefinedNumericCountsSkippedValues) {
    memory_table table({"amount"});
    table.add_partition({{v("10")}, {v("n/a")}, {v("30")}, {v("abc")}});
    profiler_options opts;
    opts.predefined_types["amount"] = logical_type::integer_;
    const ColumnProfiles res = profile(table, opts);
    const ColumnProfile& p = res.at("amount");
    ASSERT_TRUE(p.numeric.has_value());
    EXPECT_EQ(p.numeric->count, 2u);
    EXPECT_EQ(p.numeric->skipped, 2u);
    EXPECT_DOUBLE_EQ(p.numeric->mean, 20.0);
}

TEST(RunnerTest, NumericStatsDroppedForNonNumericColumns) {
    memory_table table({"mixed"});
    table.add_partition({{v("1")}, {v("2")}, {v("three")}});
    const ColumnProfiles res = profile(table);
    const ColumnProfile& p = res.at("mixed");
    EXPECT_EQ(p.data_type, logical_type::string_);
    EXPECT_FALSE(p.numeric.has_value());
}

TEST(RunnerTest, TwoPassSkipsSecondScanWhenUnneeded) {
    std::vector<owned_row> rows;
    for (int i = 0; i < 400; ++i) rows.push_back({"w" + std::to_string(i)});
    profiler_options opts;
    opts.strategy = schedule_strategy::two_pass;
    const ColumnProfiles res = profile(memory_table::split({"word"}, rows, 4), opts);
    EXPECT_EQ(res.passes, 1u);
    EXPECT_FALSE(res.at("word").histogram.has_value());
}

TEST(RunnerTest, TwoPassKeepsHistogramAtThresholdDespiteEstimateOvershoot) {
    // 120 distinct values; the dense sketch estimates slightly above 120
    std::vector<owned_row> rows;
    for (int i = 0; i < 120; ++i) rows.push_back({"v" + std::to_string(i)});
    const auto table = memory_table::split({"code"}, rows, 3);

    for (auto strategy : {schedule_strategy::single_pass, schedule_strategy::two_pass}) {
        profiler_options opts;
        opts.strategy = strategy;
        opts.low_cardinality_histogram_threshold = 120;
        const ColumnProfiles res = profile(table, opts);
        const ColumnProfile& p = res.at("code");
        EXPECT_LE(p.approx_num_distinct, 120u);
        ASSERT_TRUE(p.histogram.has_value()) << colprof::to_string(strategy);
        EXPECT_EQ(p.histogram->size(), 120u);
    }
}

TEST(RunnerTest, TwoPassDropsHistogramJustAboveThreshold) {
    std::vector<owned_row> rows;
    for (int i = 0; i < 121; ++i) rows.push_back({"v" + std::to_string(i)});
    profiler_options opts;
    opts.strategy = schedule_strategy::two_pass;
    opts.low_cardinality_histogram_threshold = 120;
    const ColumnProfiles res = profile(memory_table::split({"code"}, rows, 2), opts);
    EXPECT_FALSE(res.at("code").histogram.has_value());
}

TEST(RunnerTest, PartitioningDoesNotChangeExactStatistics) {
    std::vector<owned_row> rows;
    for (int i = 0; i < 3000; ++i) {
        rows.push_back({std::to_string(i % 37),
                        i % 13 == 0 ? std::optional<std::string>{} : std::to_string(i * 0.25),
                        std::string(i % 3 == 0 ? "true" : "false")});
    }
    const std::vector<std::string> cols = {"bucket", "amount", "flag"};
    const ColumnProfiles base = profile(memory_table::split(cols, rows, 1));
    for (std::size_t n : {2u, 5u, 16u}) {
        const ColumnProfiles other = profile(memory_table::split(cols, rows, n), {}, true);
        for (const auto& c : cols) {
            const ColumnProfile& x = base.at(c);
            const ColumnProfile& y = other.at(c);
            EXPECT_EQ(x.non_null_count, y.non_null_count) << c;
            EXPECT_EQ(x.type_counts.counts, y.type_counts.counts) << c;
            EXPECT_EQ(x.data_type, y.data_type) << c;
            EXPECT_EQ(x.approx_num_distinct, y.approx_num_distinct) << c;
            EXPECT_EQ(x.histogram.has_value(), y.histogram.has_value()) << c;
            if (x.histogram && y.histogram) {
                ASSERT_EQ(x.histogram->size(), y.histogram->size());
                for (std::size_t i = 0; i < x.histogram->size(); ++i) {
                    EXPECT_EQ((*x.histogram)[i].value, (*y.histogram)[i].value);
                    EXPECT_EQ((*x.histogram)[i].count, (*y.histogram)[i].count);
                }
            }
            ASSERT_EQ(x.numeric.has_value(), y.numeric.has_value()) << c;
            if (x.numeric) {
                EXPECT_DOUBLE_EQ(x.numeric->minimum, y.numeric->minimum);
                EXPECT_DOUBLE_EQ(x.numeric->maximum, y.numeric->maximum);
                EXPECT_NEAR(x.numeric->mean, y.numeric->mean, 1e-6);
                EXPECT_NEAR(x.numeric->std_dev, y.numeric->std_dev, 1e-6);
            }
        }
    }
}

TEST(RunnerTest, ProfileInvariants) {
    const ColumnProfiles res = profile(reference_table(4));
    for (const auto& [name, p] : res.profiles) {
        EXPECT_GE(p.completeness, 0.0) << name;
        EXPECT_LE(p.completeness, 1.0) << name;
        EXPECT_LE(p.approx_num_distinct, p.non_null_count) << name;
        if (p.numeric) {
            EXPECT_LE(p.numeric->minimum, p.numeric->mean) << name;
            EXPECT_LE(p.numeric->mean, p.numeric->maximum) << name;
            EXPECT_GE(p.numeric->std_dev, 0.0) << name;
        }
    }
}
