#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace colprof {

struct HistogramEntry {
    std::string   value;
    std::uint64_t count = 0;
    double        ratio = 0.0;
};

// Exact value -> count table holding at most max_bins distinct keys.
//
// A key that would exceed the bound marks the table overflowed; from then on
// only the keys already present keep counting, and finish() reports no
// histogram at all instead of a truncated one.
class value_histogram {
public:
    explicit value_histogram(std::size_t max_bins) : max_bins_(max_bins) {
        if (max_bins == 0) throw std::invalid_argument("max_bins must be > 0");
    }

    // Looks up by view; a string is built only for a newly admitted key.
    void add(std::string_view v) {
        auto it = counts_.lower_bound(v);
        if (it != counts_.end() && it->first == v) { ++it->second; return; }
        if (counts_.size() >= max_bins_) { overflowed_ = true; return; }
        counts_.emplace_hint(it, std::string(v), 1);
    }

    void merge(const value_histogram& other) {
        if (other.overflowed_) overflowed_ = true;
        for (const auto& [value, n] : other.counts_) {
            auto it = counts_.lower_bound(value);
            if (it != counts_.end() && it->first == value) { it->second += n; continue; }
            if (counts_.size() >= max_bins_) { overflowed_ = true; continue; }
            counts_.emplace_hint(it, value, n);
        }
    }

    bool overflowed() const { return overflowed_; }
    std::size_t max_bins() const { return max_bins_; }
    std::size_t size() const { return counts_.size(); }

    std::uint64_t count_of(std::string_view v) const {
        auto it = counts_.find(v);
        return it == counts_.end() ? 0 : it->second;
    }

    // Entries by descending count, ties by ascending value; ratio is relative
    // to the column's non-null count.
    std::optional<std::vector<HistogramEntry>> finish(std::uint64_t non_null_count) const {
        if (overflowed_) return std::nullopt;
        std::vector<HistogramEntry> out;
        out.reserve(counts_.size());
        for (const auto& [value, n] : counts_) {
            const double ratio = non_null_count > 0
                ? static_cast<double>(n) / static_cast<double>(non_null_count) : 0.0;
            out.push_back(HistogramEntry{value, n, ratio});
        }
        std::sort(out.begin(), out.end(), [](const HistogramEntry& a, const HistogramEntry& b) {
            if (a.count != b.count) return a.count > b.count;
            return a.value < b.value;
        });
        return out;
    }

private:
    std::size_t max_bins_;
    bool overflowed_ = false;
    std::map<std::string, std::uint64_t, std::less<>> counts_;
};

}
