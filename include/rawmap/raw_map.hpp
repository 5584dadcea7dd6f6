#pragma once

/// @file raw_map.hpp
/// @brief RawMap: insertion-ordered map of raw JSON values in an arena, and
/// FrozenRawMap, its read-only view that can be shared across threads.
///
/// Layout:
///   - data:  pmr::vector<Entry> in the arena, in first-insertion order
///   - cache: PositionIndex mapping key hash -> position in data
///
/// Invariants held after every public call:
///   - cache.size() == data.size()
///   - each indexed position p resolves to an entry whose key is the key
///     that was hashed for p
///   - keys in data are unique; re-inserting a key rewrites the value in
///     place and never moves the entry
///
/// Lifetime guards (there is no borrow checker to do this for us):
///   - every access compares the arena generation captured at construction
///     with the current one and throws StaleArenaError after a reset()
///   - freeze() sets a checked-out flag that makes every mutating call
///     throw FrozenError until the FrozenRawMap is destroyed or released

#include "arena.hpp"
#include "config.hpp"
#include "detail/hash.hpp"
#include "detail/index.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "raw_value.hpp"
#include "scanner.hpp"
#include "writer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <memory_resource>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rawmap {

template <typename Hash>
class FrozenRawMap;

/// @brief An order-preserving map from keys to raw JSON values.
///
/// Iteration follows first insertion. If a key is inserted several times
/// its value is the last one inserted, its position the first one.
///
/// All memory (entries, index, copied input, decoded keys) comes from the
/// MonotonicArena passed at construction. The map must be destroyed before
/// the arena is destroyed.
///
/// @code
///   rawmap::MonotonicArena arena;
///   auto map = rawmap::RawMap<>::from_json(R"({"a":1,"b":[1,2],"a":3})", arena);
///   map.size();                // 2
///   map.get("a")->get();       // "3"
///   map.as_slice()[1].first;   // "b"
/// @endcode
template <typename Hash = StringHash>
class RawMap {
public:
    using key_type = std::string_view;
    using mapped_type = RawValue;
    using value_type = Entry;
    using size_type = size_t;
    using hasher = Hash;
    using storage_type = std::pmr::vector<Entry>;
    using const_iterator = const Entry*;

    // ─── Construction ─────────────────────────────────────────────────────

    /// @brief Empty map with a default-constructed hash strategy.
    explicit RawMap(MonotonicArena& arena)
        : RawMap(Hash{}, arena) {}

    /// @brief Empty map with an explicit hash strategy.
    RawMap(Hash hash_builder, MonotonicArena& arena)
        : arena_(&arena)
        , generation_(arena.generation())
        , data_(&arena)
        , cache_(&arena)
        , hasher_(std::move(hash_builder)) {}

    /// @brief Build a map from JSON object text.
    ///
    /// The text is copied into the arena once; keys and values are views
    /// into that copy (escaped keys are decoded into the arena).
    /// @throws ParseError if the text is not a valid JSON object.
    static RawMap from_json(std::string_view text, MonotonicArena& arena,
                            const ParseOptions& opts = {}) {
        return from_json_with_hasher(text, Hash{}, arena, opts);
    }

    static RawMap from_json_with_hasher(std::string_view text, Hash hash_builder,
                                        MonotonicArena& arena,
                                        const ParseOptions& opts = {}) {
        RawMap map(std::move(hash_builder), arena);
        map.fill(arena.copy_string(text), opts);
        return map;
    }

    /// @brief Build a map from a raw JSON object value.
    ///
    /// A value that already lives in the arena (for instance a nested object
    /// taken from another map) is borrowed as is; any other value is copied
    /// in first.
    /// @throws ParseError if the value is not a JSON object.
    static RawMap from_raw_value(RawValue raw, MonotonicArena& arena,
                                 const ParseOptions& opts = {}) {
        return from_raw_value_and_hasher(raw, Hash{}, arena, opts);
    }

    static RawMap from_raw_value_and_hasher(RawValue raw, Hash hash_builder,
                                            MonotonicArena& arena,
                                            const ParseOptions& opts = {}) {
        RawMap map(std::move(hash_builder), arena);
        map.fill(map.adopt(raw.get()), opts);
        return map;
    }

    /// @brief Exception-free from_json(). On failure the value is an empty
    /// map on the same arena and `ec` holds the parse error code.
    static result<RawMap> try_from_json(std::string_view text, MonotonicArena& arena,
                                        const ParseOptions& opts = {}) noexcept {
        try {
            return {from_json(text, arena, opts), {}};
        } catch (const ParseError& e) {
            return {RawMap(arena), e.code()};
        } catch (const std::bad_alloc&) {
            return {RawMap(arena), std::make_error_code(std::errc::not_enough_memory)};
        }
    }

    RawMap(RawMap&& other)
        : arena_(other.arena_)
        , generation_(other.generation_)
        , data_(std::move(other.checked_out_for("move").data_))
        , cache_(std::move(other.cache_))
        , hasher_(std::move(other.hasher_)) {}

    RawMap& operator=(RawMap&& other) {
        if (this != &other) {
            checked_out_for("move assignment");
            other.checked_out_for("move");
            arena_ = other.arena_;
            generation_ = other.generation_;
            // pmr containers never propagate their resource on assignment;
            // rebuild them so the storage stays on the source arena.
            std::destroy_at(&data_);
            ::new (&data_) storage_type(std::move(other.data_));
            std::destroy_at(&cache_);
            ::new (&cache_) detail::PositionIndex(std::move(other.cache_));
            hasher_ = std::move(other.hasher_);
        }
        return *this;
    }

    RawMap(const RawMap&) = delete;
    RawMap& operator=(const RawMap&) = delete;

    /// Destroying a map with a live FrozenRawMap aborts the process; release
    /// the view first.
    ~RawMap() {
        if (RAWMAP_UNLIKELY(frozen_.load(std::memory_order_acquire))) {
            detail::destroyed_while_frozen();
        }
    }

    // ─── Mutation ─────────────────────────────────────────────────────────

    /// @brief Insert a (key, value) pair.
    ///
    /// An existing key keeps its position; its value is replaced and the
    /// previous value is returned. A new key is appended at size().
    ///
    /// Key and value text that does not already live in the arena is copied
    /// into it, so the caller's buffers may go away after the call.
    /// @throws FrozenError while a FrozenRawMap is alive.
    std::optional<RawValue> insert(std::string_view key, RawValue value) {
        check_mutable("insert");
        check_live();
        value = RawValue::from_trusted(adopt(value.get()));
        const size_t h = hasher_(key);
        if (auto pos = cache_.find(h, key, key_at())) {
            return std::exchange(data_[*pos].second, value);
        }
        // Grow the index first so a failed allocation leaves both halves intact.
        cache_.reserve(data_.size() + 1);
        data_.emplace_back(adopt(key), value);
        cache_.insert(h, data_.size() - 1);
        return std::nullopt;
    }

    /// @brief Reserve room for at least `additional` more entries in both
    /// the ordered store and the index. Positions already handed out are
    /// unaffected. Aborts the process if the capacity is not addressable.
    /// @throws FrozenError while a FrozenRawMap is alive.
    void reserve(size_type additional) {
        check_mutable("reserve");
        check_live();
        if (RAWMAP_UNLIKELY(additional > max_size() - data_.size())) {
            detail::capacity_overflow();
        }
        const size_type total = data_.size() + additional;
        data_.reserve(total);
        cache_.reserve(total);
    }

    // ─── Lookup ───────────────────────────────────────────────────────────

    /// @brief The value stored for a key, if any.
    [[nodiscard]] std::optional<RawValue> get(std::string_view key) const {
        check_live();
        if (auto pos = find_position(key)) return data_[*pos].second;
        return std::nullopt;
    }

    /// @brief Position of a key in as_slice(), if present.
    [[nodiscard]] std::optional<size_type> get_index(std::string_view key) const {
        check_live();
        return find_position(key);
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return get_index(key).has_value();
    }

    // ─── Capacity ─────────────────────────────────────────────────────────

    [[nodiscard]] size_type size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    /// @brief Largest entry count the ordered store can address.
    [[nodiscard]] size_type max_size() const noexcept {
        constexpr size_type kAddressable =
            static_cast<size_type>(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(Entry);
        return data_.max_size() < kAddressable ? data_.max_size() : kAddressable;
    }

    // ─── Ordered access ───────────────────────────────────────────────────

    /// @brief The entries in insertion order.
    [[nodiscard]] Slice<const Entry> as_slice() const {
        check_live();
        return {data_.data(), data_.size()};
    }

    const_iterator begin() const { return as_slice().begin(); }
    const_iterator end() const { return as_slice().end(); }

    /// @brief Emit the map as a JSON object in insertion order. Keys are
    /// re-escaped, values are written verbatim.
    void write(JsonWriter& w) const {
        w.begin_object();
        for (const Entry& e : as_slice()) {
            w.key(e.first).raw_json(e.second.get());
        }
        w.end_object();
    }

    /// @brief Move the ordered store out; the map is left empty.
    /// The returned vector still allocates from the arena.
    [[nodiscard]] storage_type into_vec() && {
        check_mutable("into_vec");
        check_live();
        storage_type out(std::move(data_));
        data_.clear();
        cache_.clear();
        return out;
    }

    /// @brief Copy the entries into an exact-size arena array and leave the
    /// map empty. The slice lives as long as the arena.
    [[nodiscard]] Slice<const Entry> into_bump_slice() && {
        check_mutable("into_bump_slice");
        check_live();
        const size_type n = data_.size();
        Entry* out = arena_->allocate_uninit<Entry>(n);
        std::uninitialized_copy(data_.begin(), data_.end(), out);
        data_.clear();
        cache_.clear();
        return {out, n};
    }

    // ─── Freezing ─────────────────────────────────────────────────────────

    /// @brief Check the map out into a read-only view that can be shared
    /// with other threads. Mutation through this handle fails until the view
    /// is destroyed.
    /// @throws FrozenError if another view is alive.
    [[nodiscard]] FrozenRawMap<Hash> freeze() {
        return FrozenRawMap<Hash>(*this);
    }

    [[nodiscard]] bool is_frozen() const noexcept {
        return frozen_.load(std::memory_order_acquire);
    }

    // ─── Accessors ────────────────────────────────────────────────────────

    /// @brief The arena backing keys and values.
    [[nodiscard]] MonotonicArena& bump() const noexcept { return *arena_; }

    [[nodiscard]] const Hash& hash_function() const noexcept { return hasher_; }

private:
    friend class FrozenRawMap<Hash>;

    MonotonicArena* arena_;
    uint64_t generation_;
    storage_type data_;
    detail::PositionIndex cache_;
    Hash hasher_;
    std::atomic<bool> frozen_{false};

    /// Append the members of the object in `text`, which lives in the arena.
    void fill(std::string_view text, const ParseOptions& opts) {
        if (size_t est = detail::Scanner::estimate_members(text)) {
            reserve(est);
        }
        detail::Scanner::scan_object(text, *arena_, opts,
            [this](std::string_view key, RawValue value) {
                return !insert(key, value).has_value();
            });
    }

    /// `s` itself if the arena already handed out its bytes, else a copy.
    std::string_view adopt(std::string_view s) {
        if (s.empty() || arena_->owns(s.data())) return s;
        return arena_->copy_string(s);
    }

    auto key_at() const noexcept {
        return [this](size_type pos) { return data_[pos].first; };
    }

    std::optional<size_type> find_position(std::string_view key) const {
        return cache_.find(hasher_(key), key, key_at());
    }

    void check_live() const {
        if (RAWMAP_UNLIKELY(arena_->generation() != generation_)) {
            throw StaleArenaError("RawMap used after its arena was reset");
        }
    }

    void check_mutable(const char* op) const {
        if (RAWMAP_UNLIKELY(frozen_.load(std::memory_order_acquire))) {
            throw FrozenError(std::string("RawMap::") + op +
                              "() while a FrozenRawMap is alive");
        }
    }

    RawMap& checked_out_for(const char* op) {
        check_mutable(op);
        return *this;
    }

    /// Called by FrozenRawMap: set the flag, fail if it was already set.
    void check_out() {
        check_live();
        if (frozen_.exchange(true, std::memory_order_acq_rel)) {
            throw FrozenError("RawMap::freeze() while another FrozenRawMap is alive");
        }
    }

    void check_in() noexcept {
        frozen_.store(false, std::memory_order_release);
    }
};

/// @brief Read-only view of a RawMap that keeps the map checked out.
///
/// The view borrows the map's entries and index without copying. While it
/// exists no mutating call on the map succeeds, so the entries are never
/// reallocated, reordered or rewritten. Every method is const and writes
/// nothing, so one view may be read from any number of threads at once
/// (the hash strategy's operator() must be const and reentrant).
///
/// The view must not outlive the map. It is move-only; destroying it, or
/// calling release(), hands mutation back to the map.
template <typename Hash = StringHash>
class FrozenRawMap {
public:
    using size_type = size_t;
    using const_iterator = const Entry*;

    /// @brief Check out `map`.
    /// @throws FrozenError if the map already has a live view.
    /// @throws StaleArenaError if the map's arena was reset.
    explicit FrozenRawMap(RawMap<Hash>& map) : map_(&map) {
        map.check_out();
    }

    FrozenRawMap(FrozenRawMap&& other) noexcept
        : map_(std::exchange(other.map_, nullptr)) {}

    FrozenRawMap& operator=(FrozenRawMap&& other) noexcept {
        if (this != &other) {
            release();
            map_ = std::exchange(other.map_, nullptr);
        }
        return *this;
    }

    FrozenRawMap(const FrozenRawMap&) = delete;
    FrozenRawMap& operator=(const FrozenRawMap&) = delete;

    ~FrozenRawMap() { release(); }

    /// @brief Give the map back early. The view is unusable afterwards.
    void release() noexcept {
        if (map_) {
            map_->check_in();
            map_ = nullptr;
        }
    }

    [[nodiscard]] std::optional<RawValue> get(std::string_view key) const {
        return source().get(key);
    }

    [[nodiscard]] std::optional<size_type> get_index(std::string_view key) const {
        return source().get_index(key);
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return source().contains(key);
    }

    [[nodiscard]] size_type size() const { return source().size(); }
    [[nodiscard]] bool empty() const { return source().empty(); }

    [[nodiscard]] Slice<const Entry> as_slice() const { return source().as_slice(); }

    const_iterator begin() const { return as_slice().begin(); }
    const_iterator end() const { return as_slice().end(); }

    void write(JsonWriter& w) const { source().write(w); }

private:
    RawMap<Hash>* map_;

    const RawMap<Hash>& source() const {
        if (RAWMAP_UNLIKELY(!map_)) {
            throw FrozenError("FrozenRawMap used after release", errc::view_released);
        }
        return *map_;
    }
};

} // namespace rawmap
