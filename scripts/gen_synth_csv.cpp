#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Writes a CSV whose columns exercise every profiling path: each resolved
// type, a low-cardinality histogram column, a high-cardinality key, a column
// mixing numbers and text, and cells left empty at a fixed rate.
//
// usage: gen_synth_csv <out.csv> <rows> [null_every=7] [categories=12]

namespace {

struct synth_column {
    const char* name;
    std::function<std::string(std::uint64_t)> value;
    bool nullable;
};

void write_field(std::ostream& os, const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) { os << s; return; }
    os << '"';
    for (char c : s) os << (c == '"' ? "\"\"" : std::string(1, c));
    os << '"';
}

}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: gen_synth_csv <out.csv> <rows> [null_every=7] [categories=12]\n";
        return 2;
    }
    const std::string out = argv[1];
    const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
    const std::uint64_t null_every = argc > 3 ? std::strtoull(argv[3], nullptr, 10) : 7;
    const std::uint64_t categories = argc > 4 ? std::max<std::uint64_t>(1, std::strtoull(argv[4], nullptr, 10)) : 12;

    std::ofstream f(out, std::ios::binary);
    if (!f) { std::cerr << "open failed: " << out << "\n"; return 2; }

    std::mt19937_64 rng(7);
    std::uniform_int_distribution<std::int64_t> amount(-50000, 50000);
    std::normal_distribution<double> price(100.0, 15.0);

    const std::vector<synth_column> cols = {
        {"order_id", [](std::uint64_t i) { return "ord-" + std::to_string(i); }, false},
        {"quantity", [&](std::uint64_t) { return std::to_string(amount(rng)); }, true},
        {"price",    [&](std::uint64_t) { return std::to_string(price(rng)); }, true},
        {"shipped",  [](std::uint64_t i) { return std::string(i % 3 ? "false" : "TRUE"); }, true},
        {"status",   [&](std::uint64_t i) { return "S" + std::to_string((i * 2654435761u) % categories); }, false},
        {"note",     [](std::uint64_t i) {
            return i % 5 == 0 ? std::to_string(i) : "left at door, \"ring\"\nbell " + std::to_string(i % 40);
        }, true},
    };

    for (std::size_t c = 0; c < cols.size(); ++c) f << (c ? "," : "") << cols[c].name;
    f << "\n";

    for (std::uint64_t i = 1; i <= rows; ++i) {
        for (std::size_t c = 0; c < cols.size(); ++c) {
            if (c) f << ',';
            const std::string v = cols[c].value(i);
            if (cols[c].nullable && null_every > 0 && (i + c) % null_every == 0) continue;
            write_field(f, v);
        }
        f << "\n";
    }
    if (!f) { std::cerr << "write failed: " << out << "\n"; return 2; }
    std::cerr << "wrote " << rows << " rows to " << out << "\n";
    return 0;
}
