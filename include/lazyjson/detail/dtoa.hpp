#pragma once

/// @file detail/dtoa.hpp
/// @brief Number formatting for the encoder.
///
/// JSON numbers are held as double. Integral values below 2^53 in magnitude
/// print as plain integers ("7", "-12"); everything else takes the shortest
/// representation that parses back to the same double.

#include "../config.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace lazyjson::detail {

/// Two-digit pair table "00".."99".
inline constexpr char kDigitPairs[201] =
    "00010203040506070809"
    "10111213141516171819"
    "20212223242526272829"
    "30313233343536373839"
    "40414243444546474849"
    "50515253545556575859"
    "60616263646566676869"
    "70717273747576777879"
    "80818283848586878889"
    "90919293949596979899";

/// 2^53: integers up to here are exact in a double.
inline constexpr double kMaxSafeInteger = 9007199254740992.0;

/// @brief Write a uint64_t in decimal, two digits per division.
/// @param buf Output buffer (>= 20 bytes).
/// @return Pointer past the last written character.
inline char* write_u64(char* buf, uint64_t val) noexcept {
    char tmp[20];
    char* p = tmp + sizeof(tmp);
    while (val >= 100) {
        const auto idx = static_cast<unsigned>((val % 100) * 2);
        val /= 100;
        p -= 2;
        std::memcpy(p, kDigitPairs + idx, 2);
    }
    if (val >= 10) {
        p -= 2;
        std::memcpy(p, kDigitPairs + val * 2, 2);
    } else {
        *--p = static_cast<char>('0' + val);
    }
    const auto len = static_cast<size_t>(tmp + sizeof(tmp) - p);
    std::memcpy(buf, p, len);
    return buf + len;
}

/// @brief Format a finite double as a JSON number.
/// @param buf Output buffer (>= 32 bytes).
/// @param val Finite value; the caller handles NaN and infinities.
/// @return Number of characters written.
inline size_t format_number(char* buf, double val) noexcept {
    char* const start = buf;

    if (val == 0.0) {
        // JSON has no distinct negative zero on the way out.
        *buf = '0';
        return 1;
    }

    if (std::fabs(val) < kMaxSafeInteger && val == std::floor(val)) {
        if (val < 0) {
            *buf++ = '-';
            val = -val;
        }
        buf = write_u64(buf, static_cast<uint64_t>(val));
        return static_cast<size_t>(buf - start);
    }

#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    auto [ptr, ec] = std::to_chars(buf, buf + 32, val);
    if (LAZYJSON_LIKELY(ec == std::errc{}))
        return static_cast<size_t>(ptr - start);
#endif
    // No floating-point to_chars: 17 significant digits always round-trip.
    const int n = std::snprintf(buf, 32, "%.17g", val);
    return n > 0 ? static_cast<size_t>(n) : 0;
}

} // namespace lazyjson::detail
