#include <fmt/format.h>
#include <filesystem>
#include <memory>
#include <string>

#include "../cli/cli_options.hpp"
#include "../csv/csv_source.hpp"
#include "../exec/executor.hpp"
#include "../metrics/timers.hpp"
#include "../profile/runner.hpp"
#include "../report/emit_profile_json.hpp"
#include "../util/errors.hpp"
#include "../util/log.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) try {
    const auto opt = parse_cli(argc, argv);
    colprof::set_log_level(log_level_for(opt));

    const fs::path input_path = opt.input;
    if (!fs::exists(input_path)) {
        colprof::log_error("input not found: {}", input_path.string());
        return 2; // IO error
    }

    colprof::wall_timer wt_all;
    const colprof::csv_source source(input_path, to_csv_options(opt));

    std::shared_ptr<colprof::execution_engine> engine;
    if (opt.workers > 1) engine = std::make_shared<colprof::async_engine>(opt.workers);
    else                 engine = std::make_shared<colprof::sequential_engine>();

    const colprof::column_profiler_runner runner(to_profiler_options(opt), engine);
    const colprof::ColumnProfiles profiles = runner.run(source);

    if (opt.output.empty()) {
        fmt::print("{}", colprof::profiles_json(profiles, input_path.string()));
    } else {
        colprof::emit_profile_json(opt.output, profiles, input_path.string());
    }

    wt_all.stop();
    colprof::log_info("profiled {} row(s), {} column(s) in {} pass(es), {:.1f} ms",
                      profiles.num_records, profiles.size(), profiles.passes, wt_all.ms());
    return 0;
}
catch (const cli_exit& e) {
    return e.code; // help/version or bad args, already printed by CLI11
}
catch (const colprof::input_error& e) {
    colprof::log_error("{}", e.what());
    return 2;
}
catch (const colprof::config_error& e) {
    colprof::log_error("invalid configuration: {}", e.what());
    return 3;
}
catch (const std::exception& e) {
    colprof::log_error("{}", e.what());
    return 4; // internal error
}
