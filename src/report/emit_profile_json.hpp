#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

#include "profile/profile.hpp"
#include "types/infer.hpp"
#include "util/json_escape.hpp"

namespace colprof {

inline std::string column_profile_json(const ColumnProfile& p) {
    std::string out = fmt::format(
        R"({{"name":{},"completeness":{},"approx_num_distinct":{},"data_type":"{}","data_type_inferred":{},)"
        R"("total_count":{},"non_null_count":{},)"
        R"("type_counts":{{"Integer":{},"Fractional":{},"Boolean":{},"String":{}}},)",
        json_quote(p.column), p.completeness, p.approx_num_distinct, to_string(p.data_type),
        p.is_data_type_inferred ? "true" : "false",
        p.total_count, p.non_null_count,
        p.type_counts[logical_type::integer_], p.type_counts[logical_type::fractional_],
        p.type_counts[logical_type::boolean_], p.type_counts[logical_type::string_]);

    out += R"("histogram":)";
    if (!p.histogram) {
        out += "null";
    } else {
        out += "[";
        for (std::size_t i = 0; i < p.histogram->size(); ++i) {
            const auto& e = (*p.histogram)[i];
            if (i > 0) out += ",";
            out += fmt::format(R"({{"value":{},"count":{},"ratio":{}}})", json_quote(e.value), e.count, e.ratio);
        }
        out += "]";
    }

    out += R"(,"numeric":)";
    if (!p.numeric) {
        out += "null";
    } else {
        const auto& n = *p.numeric;
        out += fmt::format(
            R"({{"minimum":{},"maximum":{},"mean":{},"std_dev":{},"count":{},"sum":{},"skipped":{}}})",
            n.minimum, n.maximum, n.mean, n.std_dev, n.count, n.sum, n.skipped);
    }
    out += "}";
    return out;
}

// profile.json, schema v1
inline std::string profiles_json(const ColumnProfiles& profiles, const std::string& source_path) {
    std::string out = fmt::format(
R"({{
  "version":"1",
  "dataset":{{"rows":{},"columns":{},"passes":{},"strategy":"{}","source_path":{}}},
  "columns":[)",
        profiles.num_records, profiles.columns.size(), profiles.passes,
        to_string(profiles.strategy), json_quote(source_path));
    for (std::size_t i = 0; i < profiles.columns.size(); ++i) {
        out += i == 0 ? "\n    " : ",\n    ";
        out += column_profile_json(profiles.at(profiles.columns[i]));
    }
    out += "\n  ]\n}\n";
    return out;
}

inline void emit_profile_json(const std::string& out_path,
                              const ColumnProfiles& profiles,
                              const std::string& source_path) {
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path);
    f << profiles_json(profiles, source_path);
    if (!f) throw std::runtime_error("Failed to write: " + out_path);
}

}
