/// @file bench_raw_map.cpp
/// @brief Benchmarks for building, querying, freezing and serializing RawMap.
///
/// Measures:
///   - from_json on small/medium/large objects with arena reuse
///   - insert throughput with and without reserve()
///   - lookup cost (hit and miss) on a populated map
///   - freeze() checkout cost and parallel reads through a frozen view
///   - serialization throughput

#include <rawmap/rawmap.hpp>

#include <benchmark/benchmark.h>

#include <string>
#include <vector>

using namespace rawmap;

// =============================================================================
// Test data generators
// =============================================================================

/// Small object (~50 bytes).
static std::string gen_small() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

/// Network-like message (~200 bytes): event notification.
static std::string gen_network_msg() {
    return R"({"type":"client_connect","ap_id":"AP-001-FLOOR3",)"
           R"("mac":"AA:BB:CC:DD:EE:FF","rssi":-42,"channel":36,)"
           R"("timestamp":1707350400,"ssid":"Corporate-5G",)"
           R"("ip":"192.168.1.105","vlan":100})";
}

/// Wide object with `n` members of mixed value types.
static std::string gen_wide(int n) {
    std::string s = "{";
    for (int i = 0; i < n; ++i) {
        if (i > 0) s += ",";
        s += R"("field_)" + std::to_string(i) + R"(":)";
        switch (i % 4) {
            case 0: s += std::to_string(i * 7); break;
            case 1: s += R"("value_)" + std::to_string(i) + R"(")"; break;
            case 2: s += R"([1,2,{"x":null}])"; break;
            default: s += R"({"id":)" + std::to_string(i) + R"(,"ok":true})"; break;
        }
    }
    s += "}";
    return s;
}

static std::vector<std::string> gen_keys(int n) {
    std::vector<std::string> keys;
    keys.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) keys.push_back("field_" + std::to_string(i));
    return keys;
}

// =============================================================================
// Construction from JSON
// =============================================================================

static void BM_FromJson_Small(benchmark::State& state) {
    auto input = gen_small();
    MonotonicArena arena(8192);

    for (auto _ : state) {
        {
            auto map = RawMap<>::from_json(input, arena);
            auto n_entries = map.size();
            benchmark::DoNotOptimize(n_entries);
        }
        arena.reset();
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FromJson_Small);

static void BM_FromJson_NetworkMsg(benchmark::State& state) {
    auto input = gen_network_msg();
    MonotonicArena arena(4096);

    for (auto _ : state) {
        {
            auto map = RawMap<>::from_json(input, arena);
            auto n_entries = map.size();
            benchmark::DoNotOptimize(n_entries);
        }
        arena.reset();
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FromJson_NetworkMsg);

static void BM_FromJson_Wide(benchmark::State& state) {
    auto input = gen_wide(static_cast<int>(state.range(0)));
    MonotonicArena arena(256 * 1024);

    for (auto _ : state) {
        {
            auto map = RawMap<>::from_json(input, arena);
            auto n_entries = map.size();
            benchmark::DoNotOptimize(n_entries);
        }
        arena.reset();
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_FromJson_Wide)->Arg(16)->Arg(256)->Arg(4096);

static void BM_FromJson_SeededHash(benchmark::State& state) {
    auto input = gen_wide(256);
    MonotonicArena arena(64 * 1024);
    const auto hasher = SeededStringHash::random();

    for (auto _ : state) {
        {
            auto map = RawMap<SeededStringHash>::from_json_with_hasher(input, hasher, arena);
            auto n_entries = map.size();
            benchmark::DoNotOptimize(n_entries);
        }
        arena.reset();
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_FromJson_SeededHash);

// =============================================================================
// Insert
// =============================================================================

static void BM_Insert(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    const bool reserve = state.range(1) != 0;
    auto keys = gen_keys(n);
    const auto value = RawValue::from_trusted("true");
    MonotonicArena arena(1024 * 1024);

    for (auto _ : state) {
        {
            RawMap<> map(arena);
            if (reserve) map.reserve(static_cast<size_t>(n));
            for (const auto& k : keys) map.insert(k, value);
            auto n_entries = map.size();
            benchmark::DoNotOptimize(n_entries);
        }
        arena.reset();
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Insert)->Args({64, 0})->Args({64, 1})->Args({4096, 0})->Args({4096, 1});

static void BM_InsertOverwrite(benchmark::State& state) {
    auto keys = gen_keys(64);
    const auto value = RawValue::from_trusted("null");
    MonotonicArena arena(64 * 1024);
    RawMap<> map(arena);
    for (const auto& k : keys) map.insert(k, value);

    for (auto _ : state) {
        for (const auto& k : keys) {
            auto old = map.insert(k, value);
            benchmark::DoNotOptimize(old);
        }
    }
    state.SetItemsProcessed(state.iterations() * 64);
}
BENCHMARK(BM_InsertOverwrite);

// =============================================================================
// Lookup
// =============================================================================

static void BM_Lookup_Hit(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto input = gen_wide(n);
    auto keys = gen_keys(n);
    MonotonicArena arena(1024 * 1024);
    auto map = RawMap<>::from_json(input, arena);

    for (auto _ : state) {
        for (const auto& k : keys) {
            auto v = map.get(k);
            benchmark::DoNotOptimize(v);
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Lookup_Hit)->Arg(16)->Arg(256)->Arg(4096);

static void BM_Lookup_Miss(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto input = gen_wide(n);
    std::vector<std::string> misses;
    for (int i = 0; i < n; ++i) misses.push_back("absent_" + std::to_string(i));
    MonotonicArena arena(1024 * 1024);
    auto map = RawMap<>::from_json(input, arena);

    for (auto _ : state) {
        for (const auto& k : misses) {
            auto v = map.get(k);
            benchmark::DoNotOptimize(v);
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Lookup_Miss)->Arg(16)->Arg(256)->Arg(4096);

// =============================================================================
// Frozen view
// =============================================================================

static void BM_FreezeRelease(benchmark::State& state) {
    MonotonicArena arena(8192);
    auto map = RawMap<>::from_json(gen_network_msg(), arena);

    for (auto _ : state) {
        auto frozen = map.freeze();
        auto n_entries = frozen.size();
        benchmark::DoNotOptimize(n_entries);
    }
}
BENCHMARK(BM_FreezeRelease);

/// One frozen view shared by every benchmark thread.
static MonotonicArena g_shared_arena(1024 * 1024);
static RawMap<> g_shared_map = RawMap<>::from_json(gen_wide(1024), g_shared_arena);
static FrozenRawMap<> g_shared_view = g_shared_map.freeze();

static void BM_MT_FrozenLookup(benchmark::State& state) {
    auto keys = gen_keys(1024);

    for (auto _ : state) {
        for (const auto& k : keys) {
            auto v = g_shared_view.get(k);
            benchmark::DoNotOptimize(v);
        }
    }
    state.SetItemsProcessed(state.iterations() * 1024);
}
BENCHMARK(BM_MT_FrozenLookup)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

// =============================================================================
// Serialization
// =============================================================================

static void BM_Serialize(benchmark::State& state) {
    auto input = gen_wide(static_cast<int>(state.range(0)));
    MonotonicArena arena(1024 * 1024);
    auto map = RawMap<>::from_json(input, arena);

    std::string out;
    for (auto _ : state) {
        out.clear();
        JsonWriter w(out);
        map.write(w);
        char* data = out.data();
        benchmark::DoNotOptimize(data);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(out.size()));
}
BENCHMARK(BM_Serialize)->Arg(16)->Arg(256)->Arg(4096);

// =============================================================================
// Arena memory statistics
// =============================================================================

static void BM_ArenaMemoryOverhead(benchmark::State& state) {
    auto input = gen_wide(256);
    MonotonicArena arena(65536);

    for (auto _ : state) {
        {
            auto map = RawMap<>::from_json(input, arena);
            auto n_entries = map.size();
            benchmark::DoNotOptimize(n_entries);

            const ArenaStats st = arena.stats();
            state.counters["arena_used"] = static_cast<double>(st.used);
            state.counters["arena_reserved"] = static_cast<double>(st.reserved);
            state.counters["heap_chunks"] = static_cast<double>(st.heap_chunks);
        }
        arena.reset();
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ArenaMemoryOverhead);
