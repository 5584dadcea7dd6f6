#pragma once

/// @file index.hpp
/// @brief Open-addressing index from key hash to position in an ordered store.
///
/// The index never stores keys. Each slot holds the cached hash and the
/// position of the entry; equality is resolved by reading the key back out of
/// the store through a caller-supplied accessor. Entries are never removed,
/// so the table needs no tombstones and probing is plain linear probing.
///
/// Slots are trivially destructible and live in a pmr::vector, so destroying
/// an index whose memory resource was reset never reads from that memory.

#include "../config.hpp"
#include "../error.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace rawmap::detail {

class PositionIndex {
public:
    using size_type = size_t;

    explicit PositionIndex(std::pmr::memory_resource* mr) : slots_(mr) {}

    PositionIndex(PositionIndex&& other) noexcept
        : slots_(std::move(other.slots_))
        , size_(std::exchange(other.size_, 0)) {}

    PositionIndex& operator=(PositionIndex&&) = delete;

    PositionIndex(const PositionIndex&) = delete;
    PositionIndex& operator=(const PositionIndex&) = delete;

    [[nodiscard]] size_type size() const noexcept { return size_; }

    /// @brief Number of positions that fit before the next rehash.
    [[nodiscard]] size_type capacity() const noexcept {
        return slots_.size() - slots_.size() / 8;
    }

    /// @brief Look up the position of a key.
    /// @param key_at  Callable mapping a stored position to its key.
    template <typename KeyAt>
    [[nodiscard]] std::optional<size_type> find(size_t hash, std::string_view key,
                                                const KeyAt& key_at) const {
        if (RAWMAP_UNLIKELY(slots_.empty())) return std::nullopt;
        const size_type mask = slots_.size() - 1;
        for (size_type i = hash & mask;; i = (i + 1) & mask) {
            const Slot& s = slots_[i];
            if (s.pos == kEmpty) return std::nullopt;
            if (s.hash == hash && key_at(s.pos) == key) return s.pos;
        }
    }

    /// @brief Record a position for a key known to be absent.
    void insert(size_t hash, size_type pos) {
        if (RAWMAP_UNLIKELY(size_ + 1 > capacity())) {
            grow_for(size_ + 1);
        }
        place(slots_, hash, pos);
        ++size_;
    }

    /// @brief Make room for at least `total` positions without rehashing.
    void reserve(size_type total) {
        if (total > capacity()) grow_for(total);
    }

    void clear() noexcept {
        slots_.clear();
        size_ = 0;
    }

private:
    struct Slot {
        size_t hash;
        size_type pos;
    };

    static constexpr size_type kEmpty = std::numeric_limits<size_type>::max();
    static constexpr size_type kMinSlots = 8;

    std::pmr::vector<Slot> slots_;
    size_type size_ = 0;

    /// Smallest power-of-two slot count keeping `total` under a 7/8 load.
    static size_type slots_for(size_type total) noexcept {
        if (RAWMAP_UNLIKELY(total > std::numeric_limits<size_type>::max() / 8)) {
            capacity_overflow();
        }
        const size_type wanted = total * 8 / 7 + 1;
        size_type n = kMinSlots;
        while (n < wanted) {
            if (RAWMAP_UNLIKELY(n > std::numeric_limits<size_type>::max() / 2)) {
                capacity_overflow();
            }
            n *= 2;
        }
        constexpr size_type kMaxSlots =
            static_cast<size_type>(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(Slot);
        if (RAWMAP_UNLIKELY(n > kMaxSlots)) capacity_overflow();
        return n;
    }

    static void place(std::pmr::vector<Slot>& slots, size_t hash, size_type pos) noexcept {
        const size_type mask = slots.size() - 1;
        size_type i = hash & mask;
        while (slots[i].pos != kEmpty) i = (i + 1) & mask;
        slots[i] = Slot{hash, pos};
    }

    RAWMAP_NOINLINE void grow_for(size_type total) {
        size_type n = slots_for(total);
        // Geometric growth keeps insert amortized O(1).
        if (n < slots_.size() * 2) n = slots_.size() * 2;
        std::pmr::vector<Slot> fresh(n, Slot{0, kEmpty}, slots_.get_allocator());
        for (const Slot& s : slots_) {
            if (s.pos != kEmpty) place(fresh, s.hash, s.pos);
        }
        slots_ = std::move(fresh);
    }
};

} // namespace rawmap::detail
