#pragma once

/// @file utf8.hpp
/// @brief UTF-8 helpers for \u escapes: code point -> UTF-8 when decoding,
/// UTF-8 -> \uXXXX when encoding with ensure_ascii.

#include <cstdint>
#include <string>

namespace lazyjson::detail::utf8 {

/// @brief Appends the UTF-8 form of @p cp (0x0000..0x10FFFF) to @p out.
inline void encode(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// @brief Sequence length from the leading byte; 0 for an invalid lead.
inline unsigned sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

/// @brief Decodes one sequence starting at @p ptr and advances past it.
/// @return The code point, or U+FFFD for malformed, overlong or surrogate
/// sequences.
inline uint32_t decode(const char*& ptr, const char* end) noexcept {
    const auto lead = static_cast<unsigned char>(*ptr);
    const unsigned len = sequence_length(lead);

    if (len == 0 || ptr + len > end) {
        ++ptr;
        return 0xFFFD;
    }
    if (len == 1) {
        ++ptr;
        return lead;
    }

    static constexpr unsigned char kLeadMask[5] = {0, 0x7F, 0x1F, 0x0F, 0x07};
    static constexpr uint32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};

    uint32_t cp = lead & kLeadMask[len];
    for (unsigned i = 1; i < len; ++i) {
        const auto byte = static_cast<unsigned char>(ptr[i]);
        if ((byte & 0xC0) != 0x80) {
            ptr += i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }
    ptr += len;

    if (cp < kMinForLength[len]) return 0xFFFD;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0xFFFD;
    if (cp > 0x10FFFF) return 0xFFFD;
    return cp;
}

/// @brief Appends @p cp as \uXXXX, or as a surrogate pair above the BMP.
inline void encode_escaped(uint32_t cp, std::string& out) {
    static constexpr char kHex[] = "0123456789abcdef";

    auto write_u16 = [&](uint32_t val) {
        const char buf[6] = {'\\', 'u',
                             kHex[(val >> 12) & 0xF], kHex[(val >> 8) & 0xF],
                             kHex[(val >> 4) & 0xF],  kHex[val & 0xF]};
        out.append(buf, sizeof(buf));
    };

    if (cp <= 0xFFFF) {
        write_u16(cp);
    } else {
        const uint32_t adjusted = cp - 0x10000;
        write_u16(0xD800 + (adjusted >> 10));
        write_u16(0xDC00 + (adjusted & 0x3FF));
    }
}

} // namespace lazyjson::detail::utf8
