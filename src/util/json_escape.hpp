// src/util/json_escape.hpp
#pragma once
#include <fmt/format.h>
#include <iterator>
#include <string>
#include <string_view>

namespace colprof {

// Short escape for c, or nullptr when c needs none (or needs \u00XX).
inline const char* json_short_escape(unsigned char c) {
    switch (c) {
        case '"':  return "\\\"";
        case '\\': return "\\\\";
        case '\b': return "\\b";
        case '\f': return "\\f";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        default:   return nullptr;
    }
}

// Bytes >= 0x80 are copied unchanged, so UTF-8 cell text stays UTF-8.
inline void append_json_escaped(std::string& out, std::string_view in) {
    std::size_t run = 0;  // start of the pending unescaped run
    for (std::size_t i = 0; i < in.size(); ++i) {
        const auto c = static_cast<unsigned char>(in[i]);
        const char* esc = json_short_escape(c);
        if (!esc && c >= 0x20) continue;
        out.append(in.data() + run, i - run);
        if (esc) out += esc;
        else fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(c));
        run = i + 1;
    }
    out.append(in.data() + run, in.size() - run);
}

inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 8);
    append_json_escaped(out, in);
    return out;
}

inline std::string json_quote(std::string_view in) {
    std::string out = "\"";
    append_json_escaped(out, in);
    out += '"';
    return out;
}

}
