#pragma once
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "types/infer.hpp"

namespace colprof {

struct NumericProfile {
    double minimum = 0.0;
    double maximum = 0.0;
    double mean    = 0.0;
    double std_dev = 0.0;   // population
    std::uint64_t count   = 0;
    double        sum     = 0.0;
    std::uint64_t skipped = 0;  // non-null values that did not parse as numbers
};

// Accepts only the decimal grammar of is_float64(). from_chars ignores
// LC_NUMERIC, so "13.0" parses the same under any global locale.
inline std::optional<double> parse_double(std::string_view s) {
    if (!is_float64(s)) return std::nullopt;
    if (s.front() == '+') s.remove_prefix(1);  // from_chars rejects a leading '+'
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

// count / sum / sum of squares / min / max. Merging is exact except for the
// order of floating-point additions, so results from different partitionings
// may differ in the last few bits.
struct numeric_stats {
    std::uint64_t count{0};
    std::uint64_t skipped{0};
    double sum{0.0}, sum_sq{0.0};
    double min{0.0}, max{0.0};

    void add(double x) {
        if (count == 0) { min = max = x; }
        else {
            min = std::min(min, x);
            max = std::max(max, x);
        }
        ++count;
        sum += x;
        sum_sq += x * x;
    }

    void add_raw(std::string_view s) {
        if (auto v = parse_double(s)) add(*v);
        else ++skipped;
    }

    void merge(const numeric_stats& o) {
        skipped += o.skipped;
        if (o.count == 0) return;
        if (count == 0) { min = o.min; max = o.max; }
        else {
            min = std::min(min, o.min);
            max = std::max(max, o.max);
        }
        count += o.count;
        sum += o.sum;
        sum_sq += o.sum_sq;
    }

    std::optional<NumericProfile> finish() const {
        if (count == 0) return std::nullopt;
        const double n = static_cast<double>(count);
        const double mean = sum / n;
        const double var = sum_sq / n - mean * mean;
        NumericProfile p;
        p.minimum = min;
        p.maximum = max;
        // summation error can push the mean a hair outside [min, max]
        p.mean    = std::clamp(mean, min, max);
        p.std_dev = var > 0.0 ? std::sqrt(var) : 0.0;
        p.count   = count;
        p.sum     = sum;
        p.skipped = skipped;
        return p;
    }
};

}
