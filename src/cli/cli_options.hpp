#pragma once
#include <CLI/CLI.hpp>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "csv/csv_source.hpp"
#include "profile/options.hpp"
#include "types/infer.hpp"
#include "util/log.hpp"
#include "util/nulls.hpp"

struct AppOptions {
    // Required/paths
    std::string input;
    std::string config = "config/colprof.toml";
    std::string output;                  // empty = stdout

    // Profiling
    std::vector<std::string> columns;    // empty = all
    std::vector<std::string> types;      // "column=Type"
    std::size_t histogram_threshold = 120;
    double      precision = 0.05;
    std::string strategy = "single_pass";
    std::size_t workers = 1;

    // CSV parsing
    std::size_t partition_rows = 65536;
    std::size_t chunk_bytes = 262144;   // 256 KiB default
    std::string delimiter = ",";        // single char, e.g. ","
    std::string quote     = "\"";       // single char, e.g. "\""
    bool        has_header = true;      // header row present?
    std::vector<std::string> null_tokens = colprof::default_null_tokens();

    // Logging
    bool verbose = false;
    bool quiet = false;
};

// Thrown once CLI11 has printed help, version or a usage error.
struct cli_exit {
    int code;
};

inline void validate(const AppOptions& opt) {
    auto one_char = [](const std::string& s, const char* name){
        if (s.size() != 1)
            throw CLI::ValidationError{name, "must be a single character"};
    };
    one_char(opt.delimiter, "delimiter");
    one_char(opt.quote,     "quote");

    if (opt.workers == 0)
        throw CLI::ValidationError{"workers", "must be > 0"};
    if (opt.verbose && opt.quiet)
        throw CLI::ValidationError{"verbose", "cannot be combined with --quiet"};
    for (const auto& t : opt.types) {
        const auto eq = t.rfind('=');
        if (eq == std::string::npos || eq == 0 || !colprof::parse_logical_type(t.substr(eq + 1)))
            throw CLI::ValidationError{"type", "expected COLUMN=Integer|Fractional|Boolean|String, got '" + t + "'"};
    }
}

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"colprof: single-pass column profiler for CSV files"};
    app.set_version_flag("--version", "0.2.0");
    app.set_config("--config", opt.config, "TOML file with option defaults");

    // Required/basic
    app.add_option("-i,--input",  opt.input,  "Path to input CSV")->required();
    app.add_option("-o,--output", opt.output, "Write profile JSON here instead of stdout");

    // Profiling
    app.add_option("-c,--columns", opt.columns, "Profile only these columns")->delimiter(',');
    app.add_option("-t,--type", opt.types, "Predefined type, COLUMN=Integer|Fractional|Boolean|String");
    app.add_option("--histogram-threshold", opt.histogram_threshold,
                   "Max distinct values tracked exactly per column")->default_val(120);
    app.add_option("--precision", opt.precision,
                   "Target relative error of distinct counts")->default_val(0.05);
    app.add_option("--strategy", opt.strategy, "single_pass or two_pass")
        ->check(CLI::IsMember({"single_pass", "two_pass"}))->default_val("single_pass");
    app.add_option("-j,--workers", opt.workers, "Partitions scanned in parallel")->default_val(1);

    // CSV parsing
    app.add_option("--partition-rows", opt.partition_rows, "Rows per partition")->default_val(65536);
    app.add_option("--chunk-bytes", opt.chunk_bytes, "Read block size (bytes) for indexing");
    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("-q,--quote",     opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_option("--has-header",   opt.has_header,
                   "CSV has a header row (true/false)")->default_val(true);
    app.add_option("--null-token", opt.null_tokens, "Values read as null (repeatable)");

    // Logging
    app.add_flag("-v,--verbose", opt.verbose, "Print pass progress and debug detail");
    app.add_flag("--quiet", opt.quiet, "Only print errors");

    try {
        app.parse(argc, argv);
        validate(opt);
    } catch (const CLI::ParseError& e) {
        throw cli_exit{app.exit(e) == 0 ? 0 : 1};
    }

    return opt;
}

inline colprof::profiler_options to_profiler_options(const AppOptions& opt) {
    colprof::profiler_options p;
    p.low_cardinality_histogram_threshold = opt.histogram_threshold;
    p.distinct_estimator_precision = opt.precision;
    if (!opt.columns.empty())
        p.restrict_to_columns = std::set<std::string>(opt.columns.begin(), opt.columns.end());
    for (const auto& t : opt.types) {
        const auto eq = t.rfind('=');
        p.predefined_types[t.substr(0, eq)] = *colprof::parse_logical_type(t.substr(eq + 1));
    }
    p.strategy = *colprof::parse_strategy(opt.strategy);
    p.print_status_updates = opt.verbose;
    return p;
}

inline colprof::csv_options to_csv_options(const AppOptions& opt) {
    colprof::csv_options c;
    c.delimiter = opt.delimiter[0];
    c.quote = opt.quote[0];
    c.has_header = opt.has_header;
    c.null_tokens = opt.null_tokens;
    c.partition_rows = opt.partition_rows;
    c.chunk_bytes = opt.chunk_bytes;
    return c;
}

inline colprof::log_level log_level_for(const AppOptions& opt) {
    if (opt.quiet)   return colprof::log_level::error;
    if (opt.verbose) return colprof::log_level::debug;
    return colprof::log_level::warn;
}
