/**
 * @file log.hpp
 * @brief Leveled, category-tagged logging to stderr.
 *
 * printf-style macros with a compile-time floor (NSPEED_LOG_MIN_LEVEL) and a
 * runtime threshold (SetLevel). Each record is formatted into a local buffer
 * and written with a single fprintf so lines from concurrent sessions do not
 * interleave.
 *
 * Output: [2026-01-01 12:00:00.123] [INFO] [CLIENT] message
 *
 * Usage:
 * @code
 *   NSPEED_LOG_INFO("SERVER", "listening on %u", port);
 * @endcode
 */

#ifndef NSPEED_LOG_HPP_
#define NSPEED_LOG_HPP_

#include "nspeed/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#if defined(NSPEED_PLATFORM_LINUX) || defined(NSPEED_PLATFORM_MACOS)
#include <sys/time.h>
#endif

/// Compile-time floor: 0=DEBUG 1=INFO 2=WARN 3=ERROR.
#ifndef NSPEED_LOG_MIN_LEVEL
#ifdef NDEBUG
#define NSPEED_LOG_MIN_LEVEL 1
#else
#define NSPEED_LOG_MIN_LEVEL 0
#endif
#endif

namespace nspeed {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kOff,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    default:            return "OFF";
  }
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(NSPEED_PLATFORM_LINUX) || defined(NSPEED_PLATFORM_MACOS)
  timeval tv{};
  ::gettimeofday(&tv, nullptr);
  std::tm tm_buf{};
  time_t sec = tv.tv_sec;
  ::localtime_r(&sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03ld",
                      static_cast<long>(tv.tv_usec / 1000));
#else
  (void)std::snprintf(buf, size, "%llu",
                      static_cast<unsigned long long>(SteadyNowUs()));
#endif
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/** @brief Mark logging as initialized. Output works without it. */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush stderr and mark logging as shut down. */
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "off").
 * @return true and fills @p out on a known name; false otherwise.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  struct Entry {
    const char* name;
    Level level;
  };
  static constexpr Entry kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"off", Level::kOff},
  };
  for (const Entry& e : kNames) {
    const char* a = name;
    const char* b = e.name;
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = e.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace nspeed

// ============================================================================
// Macros
// ============================================================================

#define NSPEED_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                    \
    if (NSPEED_LOG_MIN_LEVEL <= 0) {                                      \
      ::nspeed::log::LogWrite(::nspeed::log::Level::kDebug, cat, __FILE__, \
                              __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                     \
  } while (0)

#define NSPEED_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                    \
    if (NSPEED_LOG_MIN_LEVEL <= 1) {                                      \
      ::nspeed::log::LogWrite(::nspeed::log::Level::kInfo, cat, __FILE__,  \
                              __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                     \
  } while (0)

#define NSPEED_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                    \
    if (NSPEED_LOG_MIN_LEVEL <= 2) {                                      \
      ::nspeed::log::LogWrite(::nspeed::log::Level::kWarn, cat, __FILE__,  \
                              __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                     \
  } while (0)

#define NSPEED_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                    \
    ::nspeed::log::LogWrite(::nspeed::log::Level::kError, cat, __FILE__,   \
                            __LINE__, fmt, ##__VA_ARGS__);                \
  } while (0)

#endif  // NSPEED_LOG_HPP_
