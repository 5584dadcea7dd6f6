#pragma once

/// @file config.hpp
/// @brief Configuration macros for the rawmap library.
///
/// Controls:
///   - Branch prediction and inlining hints
///   - SIMD opt-in for the raw scanner
///   - Nesting depth limit and default arena block size

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define RAWMAP_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define RAWMAP_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define RAWMAP_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define RAWMAP_LIKELY(x)   (x)
    #define RAWMAP_UNLIKELY(x) (x)
    #define RAWMAP_NOINLINE    __declspec(noinline)
#else
    #define RAWMAP_LIKELY(x)   (x)
    #define RAWMAP_UNLIKELY(x) (x)
    #define RAWMAP_NOINLINE
#endif

// =====================================================================
// PMR (C++17 <memory_resource>) is required: the ordered store and the
// position index are std::pmr containers backed by the arena.
// =====================================================================

#if !__has_include(<memory_resource>)
    #error "rawmap requires <memory_resource> (C++17 polymorphic allocators)"
#endif

// =====================================================================
// Recursion depth limit for the raw scanner (stack overflow protection)
// =====================================================================

#if !defined(RAWMAP_MAX_DEPTH)
    #define RAWMAP_MAX_DEPTH 512
#endif

// =====================================================================
// First heap block size of a heap-only MonotonicArena
// =====================================================================

#if !defined(RAWMAP_DEFAULT_BLOCK_SIZE)
    #define RAWMAP_DEFAULT_BLOCK_SIZE 4096
#endif
