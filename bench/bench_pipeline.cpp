#include "csv/csv_source.hpp"
#include "exec/executor.hpp"
#include "metrics/timers.hpp"
#include "profile/runner.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

using std::string;
namespace fs = std::filesystem;

int main(int argc, char** argv) try {
  // Defaults
  string dataPath;
  size_t partitionRows = 65536;
  size_t workers = 1;
  string strategy = "single_pass";

  // Supported:
  //   --data <file>         | --data=<file>
  //   --partition-rows <N>  | --partition-rows=<N>
  //   --workers <N>         | --workers=<N>
  //   --strategy single_pass|two_pass
  // Fallback positional: <input.csv> [partition_rows]
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);

    auto eat_next_str = [&](std::string_view name, string* out)->bool{
      if (i+1<argc){ *out = argv[++i]; return true; }
      fmt::print(stderr, "missing value for {}\n", name);
      return false;
    };
    auto eat_next_size = [&](std::string_view name, size_t* out)->bool{
      if (i+1<argc){ *out = static_cast<size_t>(std::stoull(argv[++i])); return true; }
      fmt::print(stderr, "missing value for {}\n", name);
      return false;
    };

    if (a.rfind("--data=",0)==0) {
      dataPath = string(a.substr(7));
    } else if (a == "--data") {
      if (!eat_next_str("--data", &dataPath)) return 2;
    } else if (a.rfind("--partition-rows=",0)==0) {
      partitionRows = static_cast<size_t>(std::stoull(string(a.substr(17))));
    } else if (a == "--partition-rows") {
      if (!eat_next_size("--partition-rows", &partitionRows)) return 2;
    } else if (a.rfind("--workers=",0)==0) {
      workers = static_cast<size_t>(std::stoull(string(a.substr(10))));
    } else if (a == "--workers") {
      if (!eat_next_size("--workers", &workers)) return 2;
    } else if (a.rfind("--strategy=",0)==0) {
      strategy = string(a.substr(11));
    } else if (a == "--strategy") {
      if (!eat_next_str("--strategy", &strategy)) return 2;
    } else if (!dataPath.size() && a.size() && a[0] != '-') {
      dataPath = string(a);
      if (i+1<argc && argv[i+1][0] != '-') {
        ++i;
        partitionRows = static_cast<size_t>(std::stoull(argv[i]));
      }
    } else {
      // ignore unknown flags so you can pass extra args without breaking
    }
  }

  if (dataPath.empty()){
    fmt::print(stderr,
      "usage:\n"
      "  colprof_bench <input.csv> [partition_rows]\n"
      "  colprof_bench --data <input.csv> [--partition-rows N] [--workers N] [--strategy single_pass|two_pass]\n");
    return 2;
  }

  std::error_code ec;
  const auto bytes = fs::file_size(dataPath, ec);
  if (ec || bytes == 0){
    fmt::print(stderr, "file empty or missing: {}\n", dataPath);
    return 2;
  }
  const auto strat = colprof::parse_strategy(strategy);
  if (!strat){
    fmt::print(stderr, "unknown strategy: {}\n", strategy);
    return 2;
  }

  colprof::wall_timer wt;
  colprof::csv_options copt;
  copt.partition_rows = partitionRows;
  const colprof::csv_source source(dataPath, copt);
  wt.stop();
  const double index_ms = wt.ms();

  colprof::profiler_options popt;
  popt.strategy = *strat;
  std::shared_ptr<colprof::execution_engine> engine;
  if (workers > 1) engine = std::make_shared<colprof::async_engine>(workers);
  else             engine = std::make_shared<colprof::sequential_engine>();
  const colprof::column_profiler_runner runner(popt, engine);

  wt.start();
  const auto res = runner.run(source);
  wt.stop();

  const double secs = wt.ms()/1000.0;
  const double mb   = double(bytes)/(1024.0*1024.0);
  const double mbps = secs>0? (mb*res.passes/secs) : 0.0;
  const double rps  = secs>0? (double(res.num_records)/secs) : 0.0;

  fmt::print("bench_profile,file={},rows={},cols={},partitions={},workers={},strategy={},passes={},"
             "index_ms={:.1f},sec={:.3f},MB/s={:.2f},rows/s={:.0f}\n",
             dataPath, res.num_records, res.size(), source.partition_count(), workers,
             colprof::to_string(res.strategy), res.passes, index_ms, secs, mbps, rps);
  return 0;
}
catch (const std::exception& e) {
  fmt::print(stderr, "bench failed: {}\n", e.what());
  return 4;
}
