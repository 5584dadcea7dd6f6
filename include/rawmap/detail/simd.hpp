#pragma once

/// @file simd.hpp
/// @brief SIMD-accelerated scans for the raw scanner.
///
/// Supported platforms (opt-in via RAWMAP_SIMD_ENABLED):
///   - x86_64: SSE2, 16 bytes/iteration
///   - ARM/AArch64: NEON, 16 bytes/iteration
/// Falls back to a scalar loop everywhere else and for the tail bytes.

#include <cstddef>
#include <cstdint>

#if defined(RAWMAP_SIMD_ENABLED)
    #if defined(__SSE2__) || defined(_M_X64) || defined(_M_AMD64)
        #define RAWMAP_SSE2 1
        #include <emmintrin.h>
    #elif defined(__ARM_NEON) || defined(__ARM_NEON__)
        #define RAWMAP_NEON 1
        #include <arm_neon.h>
    #endif
#endif

namespace rawmap::detail::simd {

namespace {

inline int ctz32(uint32_t v) noexcept {
#if defined(_MSC_VER)
    unsigned long idx;
    _BitScanForward(&idx, v);
    return static_cast<int>(idx);
#else
    return __builtin_ctz(v);
#endif
}

#if defined(RAWMAP_NEON)
/// Equivalent of _mm_movemask_epi8 for a 0x00/0xFF lane mask.
inline uint16_t neon_movemask(uint8x16_t v) noexcept {
    static const uint8_t kBits[16] = {
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80,
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80
    };
    uint8x16_t masked = vandq_u8(v, vld1q_u8(kBits));
    uint8x8_t paired = vpadd_u8(vget_low_u8(masked), vget_high_u8(masked));
    paired = vpadd_u8(paired, paired);
    paired = vpadd_u8(paired, paired);
    return vget_lane_u16(vreinterpret_u16_u8(paired), 0);
}
#endif

inline bool is_string_special(char c) noexcept {
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u >= 0x80 || c == '"' || c == '\\';
}

} // anonymous namespace

// ═════════════════════════════════════════════════════════════════════════════
//  skip_whitespace: first byte that is not ' ', '\t', '\n' or '\r'
// ═════════════════════════════════════════════════════════════════════════════

inline const char* skip_whitespace(const char* ptr, const char* end) noexcept {
#if defined(RAWMAP_SSE2)
    const __m128i ws_space = _mm_set1_epi8(' ');
    const __m128i ws_tab   = _mm_set1_epi8('\t');
    const __m128i ws_nl    = _mm_set1_epi8('\n');
    const __m128i ws_cr    = _mm_set1_epi8('\r');
    while (ptr + 16 <= end) {
        __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(ptr));
        __m128i cmp = _mm_or_si128(
            _mm_or_si128(_mm_cmpeq_epi8(chunk, ws_space), _mm_cmpeq_epi8(chunk, ws_tab)),
            _mm_or_si128(_mm_cmpeq_epi8(chunk, ws_nl), _mm_cmpeq_epi8(chunk, ws_cr)));
        auto mask = static_cast<uint32_t>(_mm_movemask_epi8(cmp));
        if (mask != 0xFFFFu) return ptr + ctz32(~mask);
        ptr += 16;
    }
#elif defined(RAWMAP_NEON)
    const uint8x16_t ws_space = vdupq_n_u8(' ');
    const uint8x16_t ws_tab   = vdupq_n_u8('\t');
    const uint8x16_t ws_nl    = vdupq_n_u8('\n');
    const uint8x16_t ws_cr    = vdupq_n_u8('\r');
    while (ptr + 16 <= end) {
        uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(ptr));
        uint8x16_t cmp = vorrq_u8(
            vorrq_u8(vceqq_u8(chunk, ws_space), vceqq_u8(chunk, ws_tab)),
            vorrq_u8(vceqq_u8(chunk, ws_nl), vceqq_u8(chunk, ws_cr)));
        uint16_t mask = neon_movemask(cmp);
        if (mask != 0xFFFFu) return ptr + ctz32(static_cast<uint16_t>(~mask));
        ptr += 16;
    }
#endif
    while (ptr < end) {
        char c = *ptr;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') ++ptr;
        else break;
    }
    return ptr;
}

// ═════════════════════════════════════════════════════════════════════════════
//  find_string_special: first '"', '\\', control byte (< 0x20) or
//  non-ASCII byte (>= 0x80) in a string body
// ═════════════════════════════════════════════════════════════════════════════
//
// A signed compare against 0x20 flags both control bytes and bytes >= 0x80
// (negative as int8), so one compare covers both classes.

inline const char* find_string_special(const char* ptr, const char* end) noexcept {
#if defined(RAWMAP_SSE2)
    const __m128i q_quote  = _mm_set1_epi8('"');
    const __m128i q_bslash = _mm_set1_epi8('\\');
    const __m128i q_space  = _mm_set1_epi8(0x20);
    while (ptr + 16 <= end) {
        __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(ptr));
        __m128i cmp = _mm_or_si128(
            _mm_or_si128(_mm_cmpeq_epi8(chunk, q_quote), _mm_cmpeq_epi8(chunk, q_bslash)),
            _mm_cmplt_epi8(chunk, q_space));
        int mask = _mm_movemask_epi8(cmp);
        if (mask != 0) return ptr + ctz32(static_cast<uint32_t>(mask));
        ptr += 16;
    }
#elif defined(RAWMAP_NEON)
    const uint8x16_t q_quote  = vdupq_n_u8('"');
    const uint8x16_t q_bslash = vdupq_n_u8('\\');
    const int8x16_t  q_space  = vdupq_n_s8(0x20);
    while (ptr + 16 <= end) {
        uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(ptr));
        uint8x16_t cmp = vorrq_u8(
            vorrq_u8(vceqq_u8(chunk, q_quote), vceqq_u8(chunk, q_bslash)),
            vcltq_s8(vreinterpretq_s8_u8(chunk), q_space));
        uint16_t mask = neon_movemask(cmp);
        if (mask != 0) return ptr + ctz32(mask);
        ptr += 16;
    }
#endif
    while (ptr < end && !is_string_special(*ptr)) ++ptr;
    return ptr;
}

} // namespace rawmap::detail::simd
