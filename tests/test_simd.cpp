/// @file test_simd.cpp
/// @brief Tests for the block scans used by the scanner (SSE2/NEON or
/// scalar), swept over lengths that straddle the 16-byte block size.
///
/// Configure with -DRAWMAP_ENABLE_SIMD=OFF to run the same cases against the
/// scalar loop only.

#include <gtest/gtest.h>
#include <rawmap/rawmap.hpp>
#include <rawmap/detail/simd.hpp>

#include <iostream>
#include <string>

namespace simd = rawmap::detail::simd;

namespace {

const char* active_path() {
#if defined(RAWMAP_SSE2)
    return "SSE2";
#elif defined(RAWMAP_NEON)
    return "NEON";
#else
    return "scalar";
#endif
}

/// Offset of the scan result within `s`.
template <typename Scan>
size_t stop_of(const std::string& s, Scan scan) {
    return static_cast<size_t>(scan(s.data(), s.data() + s.size()) - s.data());
}

size_t ws_stop(const std::string& s) { return stop_of(s, simd::skip_whitespace); }
size_t str_stop(const std::string& s) { return stop_of(s, simd::find_string_special); }

} // namespace

TEST(SimdPath, Report) {
    std::cout << "[   INFO   ] block scan path: " << active_path() << std::endl;
    SUCCEED();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Length sweep
// ═══════════════════════════════════════════════════════════════════════════════

class BlockScan : public ::testing::TestWithParam<size_t> {};

TEST_P(BlockScan, WhitespaceRunsToEnd) {
    const size_t n = GetParam();
    EXPECT_EQ(ws_stop(std::string(n, ' ')), n);
    std::string mixed;
    for (size_t i = 0; i < n; ++i) mixed += " \t\n\r"[i % 4];
    EXPECT_EQ(ws_stop(mixed), n);
}

TEST_P(BlockScan, WhitespaceStopsAtEveryToken) {
    const size_t n = GetParam();
    for (char token : {'{', '"', '0', ',', ':', '}'}) {
        std::string s(n, '\n');
        s += token;
        s += "   ";
        EXPECT_EQ(ws_stop(s), n) << "token=" << token;
    }
}

TEST_P(BlockScan, WhitespaceRejectsOtherControls) {
    const size_t n = GetParam();
    if (n < 2) return;
    for (char ctl : {'\v', '\f', '\0'}) {
        std::string s(n, '\r');
        s[n - 2] = ctl;
        EXPECT_EQ(ws_stop(s), n - 2) << "ctl=" << static_cast<int>(ctl);
    }
}

TEST_P(BlockScan, StringBodyRunsToEnd) {
    const size_t n = GetParam();
    EXPECT_EQ(str_stop(std::string(n, 'q')), n);
    EXPECT_EQ(str_stop(std::string(n, ' ')), n);
    EXPECT_EQ(str_stop(std::string(n, '~')), n);
}

TEST_P(BlockScan, StringStopsAtFirstSpecial) {
    const size_t n = GetParam();
    if (n == 0) return;
    const char specials[] = {'"', '\\', '\x1f', '\x01', static_cast<char>(0x80),
                             static_cast<char>(0xE2)};
    for (size_t at : {size_t(0), n / 2, n - 1}) {
        for (char sp : specials) {
            std::string s(n, 'k');
            s[at] = sp;
            if (at + 1 < n) s[n - 1] = '"';
            EXPECT_EQ(str_stop(s), at)
                << "n=" << n << " at=" << at << " byte=" << static_cast<int>(sp);
        }
    }
}

INSTANTIATE_TEST_SUITE_P(
    Lengths, BlockScan,
    ::testing::Values(0, 1, 2, 15, 16, 17, 31, 32, 33, 48, 63, 64, 65, 127, 128, 129,
                      255, 256, 1000));

// ═══════════════════════════════════════════════════════════════════════════════
// Maps built from inputs that cross block boundaries
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BlockScanMaps, PaddingAroundEveryToken) {
    for (size_t pad : {0, 1, 15, 16, 17, 64, 200}) {
        const std::string ws(pad, pad % 2 ? '\t' : ' ');
        const std::string doc = ws + "{" + ws + "\"k\"" + ws + ":" + ws + "[" + ws + "1" +
                                ws + "]" + ws + "," + ws + "\"z\":0" + ws + "}" + ws;
        rawmap::MonotonicArena arena;
        auto map = rawmap::RawMap<>::from_json(doc, arena);
        ASSERT_EQ(map.size(), 2u) << "pad=" << pad;
        EXPECT_EQ(map.get("k")->get(), "[" + ws + "1" + ws + "]") << "pad=" << pad;
    }
}

TEST(BlockScanMaps, LongKeysAndValues) {
    for (size_t len : {1, 15, 16, 17, 33, 64, 129, 1024}) {
        const std::string key(len, 'K');
        const std::string body(len, 'v');
        rawmap::MonotonicArena arena;
        auto map = rawmap::RawMap<>::from_json("{\"" + key + "\":\"" + body + "\"}", arena);
        EXPECT_EQ(map.get(key)->get(), "\"" + body + "\"") << "len=" << len;
        // Unescaped keys borrow from the copied text.
        EXPECT_TRUE(arena.owns(map.as_slice()[0].first.data()));
    }
}

TEST(BlockScanMaps, EscapeAtBlockEdges) {
    for (size_t len : {17, 32, 33, 65}) {
        for (size_t at : {size_t(0), size_t(15), size_t(16), len - 1}) {
            std::string decoded(len, 'e');
            decoded[at] = '"';
            std::string key_src;
            for (size_t i = 0; i < len; ++i) key_src += i == at ? "\\\"" : "e";
            const std::string doc = "{\"" + key_src + "\":true}";

            rawmap::MonotonicArena arena;
            auto map = rawmap::RawMap<>::from_json(doc, arena);
            ASSERT_EQ(map.size(), 1u);
            EXPECT_EQ(map.as_slice()[0].first, decoded) << "len=" << len << " at=" << at;
            EXPECT_EQ(rawmap::to_string(map), doc) << "len=" << len << " at=" << at;
        }
    }
}

TEST(BlockScanMaps, MultibyteAfterAsciiRun) {
    for (size_t run : {0, 14, 15, 16, 31, 47}) {
        const std::string body = std::string(run, 'a') + "\xE2\x82\xAC" + std::string(run, 'b');
        rawmap::MonotonicArena arena;
        auto map = rawmap::RawMap<>::from_json("{\"v\":\"" + body + "\"}", arena);
        EXPECT_EQ(map.get("v")->get(), "\"" + body + "\"") << "run=" << run;
    }
}

TEST(BlockScanMaps, ControlByteAfterAsciiRunRejected) {
    for (size_t run : {0, 15, 16, 17, 40}) {
        const std::string doc = "{\"v\":\"" + std::string(run, 'c') + "\x07\"}";
        rawmap::MonotonicArena arena;
        try {
            (void)rawmap::RawMap<>::from_json(doc, arena);
            FAIL() << "run=" << run;
        } catch (const rawmap::ParseError& e) {
            EXPECT_EQ(e.code(), rawmap::make_error_code(rawmap::errc::control_character));
            EXPECT_EQ(e.location().offset, 6 + run);
        }
    }
}
