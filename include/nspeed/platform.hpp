/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros and clocks.
 */

#ifndef NSPEED_PLATFORM_HPP_
#define NSPEED_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace nspeed {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define NSPEED_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define NSPEED_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define NSPEED_PLATFORM_WINDOWS 1
#endif

/// BSD sockets are only wired up for POSIX targets.
#if defined(NSPEED_PLATFORM_LINUX) || defined(NSPEED_PLATFORM_MACOS)
#define NSPEED_HAS_NETWORK 1
#else
#define NSPEED_HAS_NETWORK 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define NSPEED_LIKELY(x) __builtin_expect(!!(x), 1)
#define NSPEED_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define NSPEED_UNUSED __attribute__((unused))
#else
#define NSPEED_LIKELY(x) (x)
#define NSPEED_UNLIKELY(x) (x)
#define NSPEED_UNUSED
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "NSPEED_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define NSPEED_ASSERT(cond) ((void)0)
#else
#define NSPEED_ASSERT(cond) \
  ((cond) ? ((void)0) : ::nspeed::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define NSPEED_CONCAT_IMPL(a, b) a##b
#define NSPEED_CONCAT(a, b) NSPEED_CONCAT_IMPL(a, b)

// ============================================================================
// Monotonic Clock
// ============================================================================

/** @brief steady_clock time in nanoseconds. */
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/** @brief steady_clock time in microseconds. */
inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

}  // namespace nspeed

#endif  // NSPEED_PLATFORM_HPP_
