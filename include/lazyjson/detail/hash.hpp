#pragma once

/// @file hash.hpp
/// @brief String hashing for member table key lookup.
///
/// wyhash-style multiply mixing: short keys (the common case for JSON
/// member names) are covered by one or two word loads.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace lazyjson::detail {

/// @brief Transparent hasher over string_view.
struct StringHash {
    using is_transparent = void;

    static constexpr uint64_t kSeed  = 0xa0761d6478bd642fULL;
    static constexpr uint64_t kSeed2 = 0xe7037ed1a0b428dbULL;

    static uint64_t load(const char* p, size_t n) noexcept {
        uint64_t v = 0;
        std::memcpy(&v, p, n);
        return v;
    }

    static uint64_t mix(uint64_t h, uint64_t a, uint64_t b) noexcept {
        h ^= a;
        h *= kSeed2;
        h ^= b;
        h *= kSeed;
        return h;
    }

    static size_t hash(const char* data, size_t len) noexcept {
        uint64_t h = kSeed ^ (len * kSeed2);

        if (len <= 3) {
            uint64_t a = 0;
            if (len > 0) {
                a = static_cast<uint64_t>(static_cast<unsigned char>(data[0])) << 16
                  | static_cast<uint64_t>(static_cast<unsigned char>(data[len >> 1])) << 8
                  | static_cast<uint64_t>(static_cast<unsigned char>(data[len - 1]));
            }
            h = mix(h, a, 0);
        } else if (len <= 8) {
            h = mix(h, load(data, 4), load(data + len - 4, 4));
        } else if (len <= 16) {
            h = mix(h, load(data, 8), load(data + len - 8, 8));
        } else {
            const char* p = data;
            for (const char* stop = data + len - 16; p <= stop; p += 16)
                h = mix(h, load(p, 8), load(p + 8, 8));
            // Tail overlaps the last block
            h = mix(h, load(data + len - 16, 8), load(data + len - 8, 8));
        }

        h ^= h >> 32;
        h *= kSeed;
        h ^= h >> 29;
        return static_cast<size_t>(h);
    }

    size_t operator()(std::string_view sv) const noexcept {
        return hash(sv.data(), sv.size());
    }
};

/// @brief Transparent comparator for heterogeneous lookup.
struct StringEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace lazyjson::detail
