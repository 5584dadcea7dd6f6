#pragma once

/// @file arena.hpp
/// @brief Bump arena that owns every byte a RawMap points at.
///
/// A map built from JSON keeps the copied input text, decoded keys, its
/// entry array and its hash index in one MonotonicArena. The arena is also a
/// std::pmr::memory_resource so the map's pmr containers draw from it
/// directly.
///
/// Memory is handed out by bumping a cursor through chunks. A chunk is
/// either the caller's buffer or a malloc'd block, each new block twice the
/// size of the previous one. Nothing is freed before reset().
///
/// reset() recycles everything at once and bumps generation(). Maps capture
/// the generation when they are created and refuse to touch their storage
/// once it changes.
///
/// @code
///   char buf[8192];
///   rawmap::MonotonicArena arena(buf, sizeof(buf));
///   for (const std::string& doc : docs) {
///       {
///           auto map = rawmap::RawMap<>::from_json(doc, arena);
///           handle(map);
///       }
///       arena.reset();
///   }
/// @endcode
///
/// An arena is not synchronized; give each producing thread its own.

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory_resource>
#include <new>
#include <string_view>

namespace rawmap {

/// @brief Point-in-time accounting of an arena.
struct ArenaStats {
    size_t reserved = 0;   ///< Bytes obtained from the caller buffer and malloc
    size_t used = 0;       ///< Bytes handed out, alignment padding included
    size_t remaining = 0;  ///< Bytes left in the current chunk
    size_t heap_chunks = 0;
    uint64_t generation = 0;
};

class MonotonicArena : public std::pmr::memory_resource {
public:
    /// @brief Arena over a caller-owned buffer, spilling to the heap when
    /// the buffer is full. The buffer must outlive the arena.
    MonotonicArena(void* buf, size_t buf_size) noexcept
        : cursor_(static_cast<char*>(buf))
        , limit_(static_cast<char*>(buf) + buf_size)
        , user_buf_(static_cast<char*>(buf))
        , user_size_(buf_size)
        , next_chunk_(buf_size < RAWMAP_DEFAULT_BLOCK_SIZE
                          ? RAWMAP_DEFAULT_BLOCK_SIZE : buf_size * 2) {}

    /// @brief Heap-only arena whose first chunk holds `first_chunk` bytes.
    explicit MonotonicArena(size_t first_chunk = RAWMAP_DEFAULT_BLOCK_SIZE)
        : next_chunk_(first_chunk < kMinChunk ? kMinChunk : first_chunk) {
        if (!push_chunk(next_chunk_)) throw std::bad_alloc();
    }

    ~MonotonicArena() override { release_chunks(nullptr); }

    MonotonicArena(const MonotonicArena&) = delete;
    MonotonicArena& operator=(const MonotonicArena&) = delete;
    MonotonicArena(MonotonicArena&&) = delete;
    MonotonicArena& operator=(MonotonicArena&&) = delete;

    /// @brief Bump-allocate `size` bytes.
    /// @return nullptr only when malloc fails.
    void* allocate(size_t size, size_t align = alignof(std::max_align_t)) noexcept {
        char* p = align_up(cursor_, align);
        if (RAWMAP_LIKELY(cursor_ && p <= limit_ &&
                          size <= static_cast<size_t>(limit_ - p))) {
            cursor_ = p + size;
            return p;
        }
        return allocate_in_new_chunk(size, align);
    }

    /// @brief Storage for `n` objects of type T, not constructed.
    /// @throws std::bad_alloc
    template <typename T>
    T* allocate_uninit(size_t n) {
        if (n == 0) return nullptr;
        if (RAWMAP_UNLIKELY(n > SIZE_MAX / sizeof(T))) throw std::bad_alloc();
        void* mem = allocate(sizeof(T) * n, alignof(T));
        if (RAWMAP_UNLIKELY(!mem)) throw std::bad_alloc();
        return static_cast<T*>(mem);
    }

    /// @brief Copy `s` into the arena.
    /// @throws std::bad_alloc
    std::string_view copy_string(std::string_view s) {
        if (s.empty()) return {};
        auto* mem = static_cast<char*>(allocate(s.size(), 1));
        if (RAWMAP_UNLIKELY(!mem)) throw std::bad_alloc();
        std::memcpy(mem, s.data(), s.size());
        return {mem, s.size()};
    }

    /// @brief True if `p` points into memory this arena has already handed
    /// out. The unused tail of the current chunk is not owned: later
    /// allocations will overwrite it.
    [[nodiscard]] bool owns(const void* p) const noexcept {
        // The cursor lives in the newest chunk, or in the caller buffer
        // until the first spill.
        if (user_buf_) {
            const size_t handed = chunks_ ? user_size_
                                          : static_cast<size_t>(cursor_ - user_buf_);
            if (in_range(p, user_buf_, handed)) return true;
        }
        for (const Chunk* c = chunks_; c; c = c->next) {
            const size_t handed = c == chunks_
                ? static_cast<size_t>(cursor_ - c->data()) : c->capacity;
            if (in_range(p, c->data(), handed)) return true;
        }
        return false;
    }

    /// @brief Recycle all memory and advance generation().
    ///
    /// A caller buffer is reused from its start and every heap chunk is
    /// freed. A heap-only arena keeps its newest (largest) chunk so the next
    /// document of the same size does not hit malloc.
    void reset() noexcept {
        ++generation_;
        if (user_buf_) {
            release_chunks(nullptr);
            cursor_ = user_buf_;
            limit_ = user_buf_ + user_size_;
            return;
        }
        Chunk* keep = chunks_;
        if (!keep) return;
        release_chunks(keep);
        keep->next = nullptr;
        chunks_ = keep;
        cursor_ = keep->data();
        limit_ = cursor_ + keep->capacity;
    }

    /// @brief Number of reset() calls so far.
    [[nodiscard]] uint64_t generation() const noexcept { return generation_; }

    [[nodiscard]] size_t bytes_used() const noexcept { return stats().used; }

    [[nodiscard]] ArenaStats stats() const noexcept {
        ArenaStats s;
        s.reserved = user_size_;
        for (const Chunk* c = chunks_; c; c = c->next) {
            s.reserved += c->capacity;
            ++s.heap_chunks;
        }
        s.remaining = cursor_ ? static_cast<size_t>(limit_ - cursor_) : 0;
        s.used = s.reserved - s.remaining;
        s.generation = generation_;
        return s;
    }

protected:
    void* do_allocate(size_t bytes, size_t alignment) override {
        void* p = allocate(bytes, alignment);
        if (RAWMAP_UNLIKELY(!p)) throw std::bad_alloc();
        return p;
    }

    /// No-op: containers may be destroyed after reset() without reading
    /// recycled memory.
    void do_deallocate(void*, size_t, size_t) override {}

    bool do_is_equal(const memory_resource& other) const noexcept override {
        return this == &other;
    }

private:
    struct Chunk {
        Chunk* next;
        size_t capacity;
        char* data() noexcept { return reinterpret_cast<char*>(this + 1); }
        const char* data() const noexcept { return reinterpret_cast<const char*>(this + 1); }
    };

    static constexpr size_t kMinChunk = 256;

    char* cursor_ = nullptr;
    char* limit_ = nullptr;
    char* user_buf_ = nullptr;
    size_t user_size_ = 0;
    Chunk* chunks_ = nullptr;  ///< Newest first
    size_t next_chunk_;
    uint64_t generation_ = 0;

    static char* align_up(char* p, size_t align) noexcept {
        const uintptr_t v = reinterpret_cast<uintptr_t>(p);
        return reinterpret_cast<char*>((v + align - 1) & ~(align - 1));
    }

    static bool in_range(const void* p, const char* base, size_t len) noexcept {
        // std::less gives a total order over unrelated pointers.
        std::less<const void*> lt;
        return base && !lt(p, base) && lt(p, base + len);
    }

    RAWMAP_NOINLINE void* allocate_in_new_chunk(size_t size, size_t align) noexcept {
        if (RAWMAP_UNLIKELY(size > SIZE_MAX - align - sizeof(Chunk))) return nullptr;
        const size_t needed = size + align - 1;
        if (RAWMAP_UNLIKELY(!push_chunk(next_chunk_ < needed ? needed : next_chunk_))) {
            return nullptr;
        }
        char* p = align_up(cursor_, align);
        cursor_ = p + size;
        return p;
    }

    bool push_chunk(size_t capacity) noexcept {
        auto* c = static_cast<Chunk*>(std::malloc(sizeof(Chunk) + capacity));
        if (RAWMAP_UNLIKELY(!c)) return false;
        c->next = chunks_;
        c->capacity = capacity;
        chunks_ = c;
        cursor_ = c->data();
        limit_ = cursor_ + capacity;
        next_chunk_ = capacity <= SIZE_MAX / 2 ? capacity * 2 : capacity;
        return true;
    }

    /// Free every chunk except `keep`.
    void release_chunks(Chunk* keep) noexcept {
        Chunk* c = chunks_;
        while (c) {
            Chunk* next = c->next;
            if (c != keep) std::free(c);
            c = next;
        }
        chunks_ = nullptr;
    }
};

} // namespace rawmap
