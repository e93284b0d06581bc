#pragma once

/// @file simd.hpp
/// @brief 16-byte-at-a-time scanning helpers for the byte scanner and the
/// string escaper.
///
/// SSE2 on x86_64, NEON on ARM, scalar loops everywhere else. Enabled only
/// when LAZYJSON_SIMD_ENABLED is defined (see config.hpp).

#include "../config.hpp"

#include <cstddef>
#include <cstdint>

#if defined(LAZYJSON_SSE2)
    #include <emmintrin.h>
#elif defined(LAZYJSON_NEON)
    #include <arm_neon.h>
#endif

namespace lazyjson::detail::simd {

// ─── Block masks ─────────────────────────────────────────────────────────────
// Each helper returns a 16-bit mask, bit N set when byte N of the block
// matches. Only the platform block masks differ; the loops are shared.

#if defined(LAZYJSON_SSE2) || defined(LAZYJSON_NEON)
inline int ctz32(uint32_t v) noexcept {
#if defined(_MSC_VER)
    unsigned long idx;
    _BitScanForward(&idx, v);
    return static_cast<int>(idx);
#else
    return __builtin_ctz(v);
#endif
}
#endif

#if defined(LAZYJSON_SSE2)

inline uint32_t whitespace_mask(const char* p) noexcept {
    const __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
    const __m128i cmp = _mm_or_si128(
        _mm_or_si128(_mm_cmpeq_epi8(chunk, _mm_set1_epi8(' ')),
                     _mm_cmpeq_epi8(chunk, _mm_set1_epi8('\t'))),
        _mm_or_si128(_mm_cmpeq_epi8(chunk, _mm_set1_epi8('\n')),
                     _mm_cmpeq_epi8(chunk, _mm_set1_epi8('\r'))));
    return static_cast<uint32_t>(_mm_movemask_epi8(cmp));
}

template <bool EnsureAscii>
inline uint32_t escape_mask(const char* p) noexcept {
    const __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
    // Unsigned c < 0x20 via a signed compare on bias-flipped bytes.
    const __m128i biased = _mm_xor_si128(chunk, _mm_set1_epi8(static_cast<char>(0x80u)));
    __m128i needs = _mm_or_si128(
        _mm_cmplt_epi8(biased, _mm_set1_epi8(static_cast<char>(0x80u + 0x20u))),
        _mm_or_si128(_mm_cmpeq_epi8(chunk, _mm_set1_epi8('"')),
                     _mm_cmpeq_epi8(chunk, _mm_set1_epi8('\\'))));
    if constexpr (EnsureAscii)
        needs = _mm_or_si128(needs, _mm_cmplt_epi8(chunk, _mm_setzero_si128()));
    return static_cast<uint32_t>(_mm_movemask_epi8(needs));
}

#elif defined(LAZYJSON_NEON)

/// Equivalent of _mm_movemask_epi8 for a 0x00/0xFF comparison result.
inline uint32_t neon_movemask(uint8x16_t v) noexcept {
    static const uint8_t kBits[16] = {
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80,
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80
    };
    const uint8x16_t masked = vandq_u8(v, vld1q_u8(kBits));
    uint8x8_t paired = vpadd_u8(vget_low_u8(masked), vget_high_u8(masked));
    paired = vpadd_u8(paired, paired);
    paired = vpadd_u8(paired, paired);
    return vget_lane_u16(vreinterpret_u16_u8(paired), 0);
}

inline uint32_t whitespace_mask(const char* p) noexcept {
    const uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(p));
    return neon_movemask(vorrq_u8(
        vorrq_u8(vceqq_u8(chunk, vdupq_n_u8(' ')), vceqq_u8(chunk, vdupq_n_u8('\t'))),
        vorrq_u8(vceqq_u8(chunk, vdupq_n_u8('\n')), vceqq_u8(chunk, vdupq_n_u8('\r')))));
}

template <bool EnsureAscii>
inline uint32_t escape_mask(const char* p) noexcept {
    const uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(p));
    uint8x16_t needs = vorrq_u8(
        vcleq_u8(chunk, vdupq_n_u8(0x1F)),
        vorrq_u8(vceqq_u8(chunk, vdupq_n_u8('"')), vceqq_u8(chunk, vdupq_n_u8('\\'))));
    if constexpr (EnsureAscii)
        needs = vorrq_u8(needs, vcgeq_u8(chunk, vdupq_n_u8(0x80)));
    return neon_movemask(needs);
}

#endif

// ═════════════════════════════════════════════════════════════════════════════
//  skip_whitespace: first byte that is not space, tab, LF or CR
// ═════════════════════════════════════════════════════════════════════════════

inline const char* skip_whitespace(const char* ptr, const char* end) noexcept {
#if defined(LAZYJSON_SSE2) || defined(LAZYJSON_NEON)
    while (ptr + 16 <= end) {
        const uint32_t mask = whitespace_mask(ptr);
        if (mask != 0xFFFF) return ptr + ctz32(~mask & 0xFFFF);
        ptr += 16;
    }
#endif
    while (ptr < end) {
        const char c = *ptr;
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return ptr;
        ++ptr;
    }
    return ptr;
}

// ═════════════════════════════════════════════════════════════════════════════
//  find_needs_escape: first '"', '\\' or control byte (and >= 0x80 with
//  EnsureAscii). The scanner uses it to find the end of a plain string run.
// ═════════════════════════════════════════════════════════════════════════════

template <bool EnsureAscii>
inline const char* find_needs_escape(const char* ptr, const char* end) noexcept {
#if defined(LAZYJSON_SSE2) || defined(LAZYJSON_NEON)
    while (ptr + 16 <= end) {
        const uint32_t mask = escape_mask<EnsureAscii>(ptr);
        if (mask != 0) return ptr + ctz32(mask);
        ptr += 16;
    }
#endif
    while (ptr < end) {
        const auto c = static_cast<unsigned char>(*ptr);
        if (c < 0x20 || c == '"' || c == '\\') return ptr;
        if constexpr (EnsureAscii) {
            if (c >= 0x80) return ptr;
        }
        ++ptr;
    }
    return ptr;
}

} // namespace lazyjson::detail::simd
