#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "profile/column_state.hpp"
#include "source/table_source.hpp"

namespace colprof {

// Output of scanning one partition: its row count and one state per profiled
// column, in profiled-column order.
struct partition_result {
    std::uint64_t rows = 0;
    std::vector<column_state> columns;
};

using partition_scan = std::function<partition_result(partition_cursor&)>;

// Fans one pass out over a source's partitions. Results come back indexed by
// partition so that the caller's fold order never depends on scheduling.
class execution_engine {
public:
    virtual ~execution_engine() = default;
    virtual std::vector<partition_result> run_pass(const table_source& src, const partition_scan& scan) = 0;
    virtual std::string name() const = 0;
};

class sequential_engine : public execution_engine {
public:
    std::vector<partition_result> run_pass(const table_source& src, const partition_scan& scan) override {
        std::vector<partition_result> out;
        out.reserve(src.partition_count());
        for (std::size_t i = 0; i < src.partition_count(); ++i) {
            auto cursor = src.open_partition(i);
            out.push_back(scan(*cursor));
        }
        return out;
    }
    std::string name() const override { return "sequential"; }
};

// Scans partitions on up to `workers` threads. Every slot of the result is
// written by exactly one task, so no locking is needed. If any partition
// throws, the remaining work is abandoned, all tasks are joined and the first
// failure (by partition index) is rethrown; no partial result escapes.
class async_engine : public execution_engine {
public:
    explicit async_engine(std::size_t workers = std::thread::hardware_concurrency())
        : workers_(std::max<std::size_t>(1, workers)) {}

    std::vector<partition_result> run_pass(const table_source& src, const partition_scan& scan) override {
        const std::size_t n = src.partition_count();
        std::vector<std::optional<partition_result>> slots(n);
        std::vector<std::exception_ptr> errors(n);
        std::atomic<std::size_t> next{0};
        std::atomic<bool> failed{false};

        auto worker = [&]() {
            for (;;) {
                const std::size_t i = next.fetch_add(1);
                if (i >= n || failed.load()) return;
                try {
                    auto cursor = src.open_partition(i);
                    slots[i] = scan(*cursor);
                } catch (...) {
                    errors[i] = std::current_exception();
                    failed.store(true);
                }
            }
        };

        std::vector<std::future<void>> futures;
        const std::size_t nthreads = std::min(workers_, std::max<std::size_t>(1, n));
        futures.reserve(nthreads);
        for (std::size_t t = 0; t < nthreads; ++t)
            futures.push_back(std::async(std::launch::async, worker));
        for (auto& f : futures) f.get();

        for (auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
        std::vector<partition_result> out;
        out.reserve(n);
        for (auto& s : slots) out.push_back(std::move(*s));
        return out;
    }

    std::string name() const override { return "async(" + std::to_string(workers_) + ")"; }
    std::size_t workers() const { return workers_; }

private:
    std::size_t workers_;
};

}
