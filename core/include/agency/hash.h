#pragma once
#include <cstdint>
#include <cstdio>
#include <string>

namespace agency::hash {

// FNV-1a 64: stable, non-crypto. Used for snapshot checksums and
// for disambiguating sanitized workflow ids on disk.
inline uint64_t fnv1a64(const std::string& s, uint64_t seed = 1469598103934665603ULL) {
    uint64_t h = seed;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

inline std::string hex64(uint64_t v) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)v);
    return std::string(buf, 16);
}

inline std::string digest_hex(const std::string& s) { return hex64(fnv1a64(s)); }

} // namespace agency::hash
