#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace colprof {

// 64-bit finalizer from MurmurHash3; full avalanche on every input bit.
inline std::uint64_t mix64(std::uint64_t x) {
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return x;
}

// Little-endian value of n <= 8 bytes, assembled byte by byte so the result
// does not depend on host byte order.
inline std::uint64_t load_le(const char* p, std::size_t n) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i)
        v |= static_cast<std::uint64_t>(static_cast<unsigned char>(p[i])) << (8 * i);
    return v;
}

// Stable across runs, processes and hosts (unlike std::hash), so sketches
// built by different workers agree on register positions.
inline std::uint64_t hash_bytes(std::string_view s) {
    std::uint64_t h = 0xe17a1465ULL ^ (static_cast<std::uint64_t>(s.size()) * 0xc6a4a7935bd1e995ULL);
    const char* p = s.data();
    const std::size_t rem = s.size() & 7U;
    const char* end = p + (s.size() - rem);
    for (; p != end; p += 8) {
        h ^= load_le(p, 8);
        h *= 0xd6e8feb86659fd93ULL;
    }
    if (rem != 0) {
        h ^= load_le(p, rem);
        h *= 0xd6e8feb86659fd93ULL;
    }
    return mix64(h);
}

}
