#pragma once
#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace colprof {

// Per-value parse result. null_ only ever describes a single cell; a column's
// resolved type is one of the other four.
enum class logical_type { null_, integer_, fractional_, boolean_, string_ };

inline constexpr std::size_t kTallyTypes = 4;

inline std::size_t tally_index(logical_type t) {
    switch (t) {
        case logical_type::integer_:    return 0;
        case logical_type::fractional_: return 1;
        case logical_type::boolean_:    return 2;
        default:                        return 3;
    }
}

inline bool is_numeric(logical_type t) {
    return t == logical_type::integer_ || t == logical_type::fractional_;
}

// optional sign, one or more digits, and the value fits int64
inline bool is_int64(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i >= s.size()) return false;
    for (std::size_t j = i; j < s.size(); ++j)
        if (!std::isdigit(static_cast<unsigned char>(s[j]))) return false;
    // from_chars rejects a leading '+'
    if (s[0] == '+') s.remove_prefix(1);
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// [+-] digits [. digits] [(e|E) [+-] digits], at least one mantissa digit
inline bool is_float64(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    bool mantissa_digit = false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { mantissa_digit = true; ++i; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { mantissa_digit = true; ++i; }
    }
    if (!mantissa_digit) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        bool exp_digit = false;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { exp_digit = true; ++i; }
        if (!exp_digit) return false;
    }
    return i == s.size();
}

inline bool ieq(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

inline bool is_bool(std::string_view s) {
    return ieq(s, "true") || ieq(s, "false");
}

inline logical_type infer_type(std::optional<std::string_view> v) {
    if (!v)              return logical_type::null_;
    if (is_int64(*v))    return logical_type::integer_;
    if (is_float64(*v))  return logical_type::fractional_;
    if (is_bool(*v))     return logical_type::boolean_;
    return logical_type::string_;
}

// Counts of non-null values per parsed type, indexed by tally_index().
struct type_tally {
    std::array<std::uint64_t, kTallyTypes> counts{};

    void add(logical_type t) { ++counts[tally_index(t)]; }
    std::uint64_t operator[](logical_type t) const { return counts[tally_index(t)]; }
    std::uint64_t total() const {
        std::uint64_t n = 0;
        for (auto c : counts) n += c;
        return n;
    }
    void merge(const type_tally& other) {
        for (std::size_t i = 0; i < kTallyTypes; ++i) counts[i] += other.counts[i];
    }
};

// Most specific type every non-null value satisfies:
// String > Fractional > Integer, with Boolean only when nothing else appears.
// A column without any non-null value resolves to string_.
inline logical_type resolve_dominant(const type_tally& t) {
    const std::uint64_t n = t.total();
    if (n == 0) return logical_type::string_;
    if (t[logical_type::boolean_] == n) return logical_type::boolean_;
    const std::uint64_t ints  = t[logical_type::integer_];
    const std::uint64_t fracs = t[logical_type::fractional_];
    if (ints + fracs == n) return fracs > 0 ? logical_type::fractional_ : logical_type::integer_;
    return logical_type::string_;
}

inline const char* to_string(logical_type t) {
    switch (t) {
        case logical_type::null_:       return "Null";
        case logical_type::integer_:    return "Integer";
        case logical_type::fractional_: return "Fractional";
        case logical_type::boolean_:    return "Boolean";
        default:                        return "String";
    }
}

inline std::optional<logical_type> parse_logical_type(std::string_view s) {
    if (ieq(s, "integer") || ieq(s, "integral")) return logical_type::integer_;
    if (ieq(s, "fractional"))                    return logical_type::fractional_;
    if (ieq(s, "boolean"))                       return logical_type::boolean_;
    if (ieq(s, "string"))                        return logical_type::string_;
    return std::nullopt;
}

}
