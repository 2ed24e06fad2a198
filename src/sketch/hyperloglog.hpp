#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "util/hash.hpp"

namespace colprof {

// HyperLogLog distinct counter with 2^p one-byte registers.
//
// Small inputs stay in a sparse mode that keeps the exact set of 64-bit value
// hashes; once that set would outgrow the register array the sketch switches
// to dense registers for good. Dense estimation uses Ertl's improved raw
// estimator ("New cardinality estimation algorithms for HyperLogLog
// sketches", 2017), which needs no empirical bias tables.
//
// add() and merge() are commutative and merge() is associative and
// idempotent, so partial sketches can be combined in any order.
class hyperloglog {
public:
    static constexpr unsigned kMinPrecision = 4;
    static constexpr unsigned kMaxPrecision = 18;
    static constexpr unsigned kDefaultPrecision = 9;

    explicit hyperloglog(unsigned precision = kDefaultPrecision)
        : p_(std::clamp(precision, kMinPrecision, kMaxPrecision)) {}

    // Smallest precision whose standard error 1.04/sqrt(2^p) meets the target.
    static unsigned precision_for_error(double relative_error) {
        if (!(relative_error > 0.0) || !(relative_error < 1.0))
            throw std::invalid_argument("relative error must be in (0, 1)");
        const double m = std::pow(1.04 / relative_error, 2.0);
        const auto p = static_cast<unsigned>(std::ceil(std::log2(m)));
        return std::clamp(p, kMinPrecision, kMaxPrecision);
    }

    unsigned precision() const { return p_; }
    std::size_t num_registers() const { return std::size_t{1} << p_; }
    double standard_error() const { return 1.04 / std::sqrt(static_cast<double>(num_registers())); }
    bool is_sparse() const { return registers_.empty(); }

    void add(std::string_view value) { add_hash(hash_bytes(value)); }

    void add_hash(std::uint64_t h) {
        if (!is_sparse()) { update(h); return; }
        auto it = std::lower_bound(sparse_.begin(), sparse_.end(), h);
        if (it != sparse_.end() && *it == h) return;
        sparse_.insert(it, h);
        if (sparse_.size() > sparse_limit()) densify();
    }

    void merge(const hyperloglog& other) {
        if (other.p_ != p_)
            throw std::invalid_argument("cannot merge hyperloglog sketches of precision " +
                                        std::to_string(p_) + " and " + std::to_string(other.p_));
        if (other.is_sparse()) {
            for (auto h : other.sparse_) add_hash(h);
            return;
        }
        if (is_sparse()) densify();
        for (std::size_t i = 0; i < registers_.size(); ++i)
            registers_[i] = std::max(registers_[i], other.registers_[i]);
    }

    std::uint64_t estimate() const {
        if (is_sparse()) return sparse_.size();
        const unsigned q = 64 - p_;
        std::vector<std::uint32_t> c(q + 2, 0);
        for (auto r : registers_) ++c[r];
        const double m = static_cast<double>(registers_.size());
        double z = m * tau((m - c[q + 1]) / m);
        for (unsigned k = q; k >= 1; --k) {
            z += c[k];
            z *= 0.5;
        }
        z += m * sigma(c[0] / m);
        if (std::isinf(z)) return 0;
        const double alpha = 0.5 / std::log(2.0);
        return static_cast<std::uint64_t>(std::llround(alpha * m * m / z));
    }

private:
    std::size_t sparse_limit() const { return num_registers() / 8; }

    void densify() {
        registers_.assign(num_registers(), 0);
        for (auto h : sparse_) update(h);
        sparse_.clear();
        sparse_.shrink_to_fit();
    }

    void update(std::uint64_t h) {
        const std::size_t idx = static_cast<std::size_t>(h >> (64 - p_));
        const std::uint8_t r = rank(h << p_);
        if (r > registers_[idx]) registers_[idx] = r;
    }

    // 1 + leading zeros of the remaining 64-p bits, q+1 when they are all zero
    std::uint8_t rank(std::uint64_t w) const {
        const unsigned q = 64 - p_;
        if (w == 0) return static_cast<std::uint8_t>(q + 1);
        std::uint8_t r = 1;
        while ((w & (std::uint64_t{1} << 63)) == 0) { ++r; w <<= 1; }
        return r;
    }

    static double sigma(double x) {
        if (x == 1.0) return std::numeric_limits<double>::infinity();
        double y = 1.0, z = x, z_prev;
        do {
            x *= x;
            z_prev = z;
            z += x * y;
            y += y;
        } while (z_prev != z);
        return z;
    }

    static double tau(double x) {
        if (x == 0.0 || x == 1.0) return 0.0;
        double y = 1.0, z = 1.0 - x, z_prev;
        do {
            x = std::sqrt(x);
            z_prev = z;
            y *= 0.5;
            z -= std::pow(1.0 - x, 2.0) * y;
        } while (z_prev != z);
        return z / 3.0;
    }

    unsigned p_;
    std::vector<std::uint64_t> sparse_;    // sorted, unique
    std::vector<std::uint8_t> registers_;  // empty while sparse
};

}
