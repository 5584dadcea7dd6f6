/// @file test_raw_map.cpp
/// @brief Unit tests for RawMap: ordering, overwrite rule, index, capacity,
/// hash strategies, consumption and arena lifetime checks.

#include <rawmap/rawmap.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace rawmap;

namespace {

RawValue raw(std::string_view text) { return RawValue::from_trusted(text); }

/// Every key lands on the same collision chain.
struct ConstantHash {
    size_t operator()(std::string_view) const noexcept { return 42; }
};

/// Hash that counts calls through a shared counter.
struct CountingHash {
    size_t* calls;
    size_t operator()(std::string_view key) const noexcept {
        ++*calls;
        return StringHash{}(key);
    }
};

std::vector<std::string> keys_of(const RawMap<>& map) {
    std::vector<std::string> out;
    for (const auto& [k, v] : map) out.emplace_back(k);
    return out;
}

} // namespace

// =============================================================================
// Empty map
// =============================================================================

TEST(RawMapEmpty, Baseline) {
    MonotonicArena arena;
    RawMap<> map(arena);

    EXPECT_EQ(map.size(), 0u);
    EXPECT_TRUE(map.empty());
    EXPECT_TRUE(map.as_slice().empty());
    EXPECT_EQ(map.begin(), map.end());
    EXPECT_FALSE(map.get("anything").has_value());
    EXPECT_FALSE(map.get_index("anything").has_value());
    EXPECT_FALSE(map.contains(""));
    EXPECT_FALSE(map.is_frozen());
    EXPECT_EQ(&map.bump(), &arena);
}

TEST(RawMapEmpty, EmptyKeyIsAValidKey) {
    MonotonicArena arena;
    RawMap<> map(arena);
    EXPECT_FALSE(map.insert("", raw("null")).has_value());
    EXPECT_EQ(map.get("")->get(), "null");
    EXPECT_EQ(map.get_index(""), 0u);
}

// =============================================================================
// Insert / lookup
// =============================================================================

TEST(RawMapInsert, NewKeysAppendInOrder) {
    MonotonicArena arena;
    RawMap<> map(arena);

    EXPECT_FALSE(map.insert("zeta", raw("1")).has_value());
    EXPECT_FALSE(map.insert("alpha", raw("2")).has_value());
    EXPECT_FALSE(map.insert("mu", raw("3")).has_value());

    EXPECT_EQ(keys_of(map), (std::vector<std::string>{"zeta", "alpha", "mu"}));
    EXPECT_EQ(map.get_index("zeta"), 0u);
    EXPECT_EQ(map.get_index("alpha"), 1u);
    EXPECT_EQ(map.get_index("mu"), 2u);
}

TEST(RawMapInsert, LastValueWinsFirstPositionWins) {
    MonotonicArena arena;
    RawMap<> map(arena);

    map.insert("a", raw("1"));
    map.insert("b", raw("[1,2]"));
    auto old = map.insert("a", raw("3"));

    ASSERT_TRUE(old.has_value());
    EXPECT_EQ(old->get(), "1");
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.get("a")->get(), "3");
    EXPECT_EQ(map.get_index("a"), 0u);
    EXPECT_EQ(map.as_slice()[0].second.get(), "3");
    EXPECT_EQ(map.as_slice()[1].first, "b");
}

TEST(RawMapInsert, RepeatedOverwriteReturnsEachPreviousValue) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("k", raw("1"));
    EXPECT_EQ(map.insert("k", raw("2"))->get(), "1");
    EXPECT_EQ(map.insert("k", raw("3"))->get(), "2");
    EXPECT_EQ(map.size(), 1u);
}

TEST(RawMapInsert, KeysAreComparedByContent) {
    MonotonicArena arena;
    RawMap<> map(arena);
    std::string k1 = "shared";
    std::string k2 = "shared";
    map.insert(arena.copy_string(k1), raw("1"));
    EXPECT_TRUE(map.insert(arena.copy_string(k2), raw("2")).has_value());
    EXPECT_EQ(map.size(), 1u);
}

TEST(RawMapInsert, IndexConsistentAfterManyInserts) {
    MonotonicArena arena(1 << 16);
    RawMap<> map(arena);
    std::vector<std::string> keys;
    for (int i = 0; i < 5000; ++i) keys.push_back("key_" + std::to_string(i));

    for (const auto& k : keys) map.insert(k, raw("true"));
    // Overwrite every third key
    for (size_t i = 0; i < keys.size(); i += 3) map.insert(keys[i], raw("false"));

    ASSERT_EQ(map.size(), keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        auto pos = map.get_index(keys[i]);
        ASSERT_TRUE(pos.has_value()) << keys[i];
        EXPECT_EQ(*pos, i);
        EXPECT_EQ(map.as_slice()[*pos].first, keys[i]);
        EXPECT_EQ(map.get(keys[i])->get(), i % 3 == 0 ? "false" : "true");
    }
    EXPECT_FALSE(map.contains("key_5000"));
}

TEST(RawMapInsert, ValuesAreOpaque) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("obj", raw(R"({"nested": [1, 2, {"x": null}]})"));
    map.insert("str", raw(R"("with \"quotes\"")"));
    EXPECT_EQ(map.get("obj")->get(), R"({"nested": [1, 2, {"x": null}]})");
    EXPECT_EQ(map.get("str")->get(), R"("with \"quotes\"")");
}

TEST(RawMapInsert, KeyAndValueOutliveCallerBuffers) {
    MonotonicArena arena;
    RawMap<> map(arena);
    for (int i = 0; i < 64; ++i) {
        std::string key = "a_fairly_long_key_number_" + std::to_string(i);
        std::string value = "[\"a fairly long value\"," + std::to_string(i) + "]";
        map.insert(key, raw(value));
    }

    ASSERT_EQ(map.size(), 64u);
    EXPECT_EQ(map.get_index("a_fairly_long_key_number_0"), 0u);
    EXPECT_EQ(map.get("a_fairly_long_key_number_63")->get(), R"(["a fairly long value",63])");
    for (const auto& [k, v] : map) {
        EXPECT_TRUE(arena.owns(k.data())) << k;
        EXPECT_TRUE(arena.owns(v.get().data())) << k;
    }
}

TEST(RawMapInsert, OverwriteCopiesForeignValue) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("k", raw("1"));
    {
        std::string replacement = "{\"replacement\":\"long enough to leave SSO\"}";
        map.insert("k", raw(replacement));
    }
    EXPECT_EQ(map.get("k")->get(), R"({"replacement":"long enough to leave SSO"})");
}

TEST(RawMapInsert, ArenaKeysAreNotCopiedAgain) {
    MonotonicArena arena;
    RawMap<> map(arena);
    const std::string_view key = arena.copy_string("interned");
    const RawValue value = raw(arena.copy_string("42"));
    map.insert(key, value);
    EXPECT_EQ(map.as_slice()[0].first.data(), key.data());
    EXPECT_EQ(map.as_slice()[0].second.get().data(), value.get().data());
}

// =============================================================================
// Capacity
// =============================================================================

TEST(RawMapCapacity, ReserveKeepsEntriesStable) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.reserve(64);

    map.insert("first", raw("1"));
    const Entry* data = map.as_slice().data();
    for (int i = 0; i < 63; ++i) {
        map.insert(arena.copy_string("k" + std::to_string(i)), raw("0"));
    }
    EXPECT_EQ(map.as_slice().data(), data);
    EXPECT_EQ(map.size(), 64u);
}

TEST(RawMapCapacity, ReserveZeroIsNoOp) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("a", raw("1"));
    map.reserve(0);
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(map.get("a")->get(), "1");
}

TEST(RawMapCapacity, ReserveDoesNotChangeContents) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("x", raw("1"));
    map.insert("y", raw("2"));
    map.reserve(1000);
    EXPECT_EQ(keys_of(map), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(map.get_index("y"), 1u);
}

TEST(RawMapCapacity, MaxSizeIsAddressable) {
    MonotonicArena arena;
    RawMap<> map(arena);
    EXPECT_GT(map.max_size(), 0u);
    EXPECT_LE(map.max_size(),
              static_cast<size_t>(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(Entry));
}

TEST(RawMapCapacityDeathTest, ReserveOverflowAborts) {
    EXPECT_DEATH({
        MonotonicArena arena;
        RawMap<> map(arena);
        map.reserve(std::numeric_limits<size_t>::max());
    }, "capacity overflow");
}

// =============================================================================
// Hash strategies
// =============================================================================

TEST(RawMapHash, CollidingHashStillCorrect) {
    MonotonicArena arena;
    RawMap<ConstantHash> map(arena);
    for (int i = 0; i < 100; ++i) {
        map.insert(arena.copy_string("k" + std::to_string(i)),
                   raw(arena.copy_string(std::to_string(i))));
    }
    ASSERT_EQ(map.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        std::string k = "k" + std::to_string(i);
        EXPECT_EQ(map.get_index(k), static_cast<size_t>(i));
    }
    EXPECT_FALSE(map.contains("k100"));
}

TEST(RawMapHash, CustomHashIsUsed) {
    MonotonicArena arena;
    size_t calls = 0;
    RawMap<CountingHash> map(CountingHash{&calls}, arena);
    map.insert("a", raw("1"));
    (void)map.get("a");
    EXPECT_EQ(calls, 2u);
    EXPECT_EQ(map.hash_function().calls, &calls);
}

TEST(RawMapHash, SeededHashDiffersBySeed) {
    SeededStringHash h1(1);
    SeededStringHash h2(2);
    EXPECT_NE(h1("some key"), h2("some key"));
    EXPECT_EQ(h1("some key"), SeededStringHash(1)("some key"));
    EXPECT_EQ(h1.seed(), 1u);
}

TEST(RawMapHash, RandomSeededMapWorks) {
    MonotonicArena arena;
    RawMap<SeededStringHash> map(SeededStringHash::random(), arena);
    map.insert("a", raw("1"));
    map.insert("b", raw("2"));
    EXPECT_EQ(map.get("b")->get(), "2");
    EXPECT_EQ(map.get_index("a"), 0u);
}

TEST(RawMapHash, DefaultHashIsDeterministic) {
    StringHash h;
    EXPECT_EQ(h("abc"), StringHash{}("abc"));
    EXPECT_NE(h("abc"), h("abd"));
}

// =============================================================================
// Consumption
// =============================================================================

TEST(RawMapConsume, IntoVecKeepsOrder) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("b", raw("1"));
    map.insert("a", raw("2"));
    map.insert("b", raw("3"));

    auto vec = std::move(map).into_vec();
    ASSERT_EQ(vec.size(), 2u);
    EXPECT_EQ(vec[0].first, "b");
    EXPECT_EQ(vec[0].second.get(), "3");
    EXPECT_EQ(vec[1].first, "a");
    EXPECT_EQ(vec.get_allocator().resource(), &arena);
}

TEST(RawMapConsume, IntoBumpSliceLivesInArena) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("x", raw("true"));
    map.insert("y", raw("false"));

    size_t used = arena.bytes_used();
    Slice<const Entry> slice = std::move(map).into_bump_slice();
    EXPECT_GE(arena.bytes_used(), used + 2 * sizeof(Entry));
    ASSERT_EQ(slice.size(), 2u);
    EXPECT_EQ(slice[0].first, "x");
    EXPECT_EQ(slice[1].second.get(), "false");
}

TEST(RawMapConsume, IntoBumpSliceOfEmptyMap) {
    MonotonicArena arena;
    RawMap<> map(arena);
    auto slice = std::move(map).into_bump_slice();
    EXPECT_TRUE(slice.empty());
}

// =============================================================================
// Moves
// =============================================================================

TEST(RawMapMove, MoveConstructTransfersEntries) {
    MonotonicArena arena;
    RawMap<> a(arena);
    a.insert("k", raw("1"));

    RawMap<> b(std::move(a));
    EXPECT_EQ(b.size(), 1u);
    EXPECT_EQ(b.get("k")->get(), "1");
    EXPECT_EQ(&b.bump(), &arena);
}

TEST(RawMapMove, MoveAssignReplacesEntries) {
    MonotonicArena arena;
    RawMap<> a(arena);
    a.insert("k", raw("1"));
    RawMap<> b(arena);
    b.insert("other", raw("2"));

    b = std::move(a);
    EXPECT_EQ(b.size(), 1u);
    EXPECT_TRUE(b.contains("k"));
    EXPECT_FALSE(b.contains("other"));
}

TEST(RawMapMove, MoveAssignAcrossArenasAdoptsSourceArena) {
    MonotonicArena src_arena;
    MonotonicArena dst_arena;
    RawMap<> a(src_arena);
    a.insert("k", raw("1"));
    RawMap<> b(dst_arena);
    b.insert("other", raw("2"));

    b = std::move(a);
    EXPECT_EQ(&b.bump(), &src_arena);

    // The destination's old arena no longer backs anything b uses.
    dst_arena.reset();
    EXPECT_EQ(b.get("k")->get(), "1");
    b.insert("k2", raw("3"));
    EXPECT_EQ(b.size(), 2u);
}

// =============================================================================
// Arena lifetime
// =============================================================================

TEST(RawMapStale, AccessAfterResetThrows) {
    MonotonicArena arena;
    RawMap<> map(arena);
    map.insert("k", raw("1"));

    arena.reset();

    EXPECT_THROW((void)map.get("k"), StaleArenaError);
    EXPECT_THROW((void)map.get_index("k"), StaleArenaError);
    EXPECT_THROW((void)map.as_slice(), StaleArenaError);
    EXPECT_THROW(map.insert("k2", raw("2")), StaleArenaError);
    EXPECT_THROW(map.reserve(4), StaleArenaError);
    EXPECT_THROW((void)map.freeze(), StaleArenaError);
}

TEST(RawMapStale, ErrorCodeIsStaleArena) {
    MonotonicArena arena;
    RawMap<> map(arena);
    arena.reset();
    try {
        (void)map.contains("k");
        FAIL() << "Expected StaleArenaError";
    } catch (const StaleArenaError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::stale_arena));
    }
}

TEST(RawMapStale, MapBuiltAfterResetIsLive) {
    MonotonicArena arena;
    arena.reset();
    RawMap<> map(arena);
    map.insert("k", raw("1"));
    EXPECT_EQ(map.get("k")->get(), "1");
}
