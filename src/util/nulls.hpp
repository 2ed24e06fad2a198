#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colprof {

inline std::vector<std::string> default_null_tokens() {
    return {"", "NA", "N/A", "null", "NULL", "NaN"};
}

inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    for (const auto& n : nulls) {
        if (s == n) return true;
    }
    return false;
}

// Raw text -> cell, absent when it matches a null token.
inline std::optional<std::string_view> to_cell(std::string_view s, const std::vector<std::string>& nulls) {
    if (is_null_like(s, nulls)) return std::nullopt;
    return s;
}

}
