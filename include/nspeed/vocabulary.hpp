/**
 * @file vocabulary.hpp
 * @brief Shared vocabulary types: expected<V,E>, ScopeGuard, common errors.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Errors are returned by value through expected<V,E> rather than thrown.
 */

#ifndef NSPEED_VOCABULARY_HPP_
#define NSPEED_VOCABULARY_HPP_

#include "nspeed/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace nspeed {

// ============================================================================
// Common Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

/// Failure of one client-side transfer; isolated to its connection id.
enum class SessionError : uint8_t {
  kSocketFailed = 0,
  kInvalidAddress,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kEncodeFailed,
};

enum class ServerError : uint8_t {
  kSocketFailed = 0,
  kBindFailed,
  kListenFailed,
  kSetOptFailed,
  kAlreadyRunning,
};

inline const char* SessionErrorName(SessionError e) noexcept {
  switch (e) {
    case SessionError::kSocketFailed:   return "socket failed";
    case SessionError::kInvalidAddress: return "invalid address";
    case SessionError::kConnectFailed:  return "connect failed";
    case SessionError::kSendFailed:     return "send failed";
    case SessionError::kRecvFailed:     return "receive failed";
    case SessionError::kEncodeFailed:   return "encode failed";
    default:                            return "unknown";
  }
}

inline const char* ServerErrorName(ServerError e) noexcept {
  switch (e) {
    case ServerError::kSocketFailed:   return "socket failed";
    case ServerError::kBindFailed:     return "bind failed";
    case ServerError::kListenFailed:   return "listen failed";
    case ServerError::kSetOptFailed:   return "setsockopt failed";
    case ServerError::kAlreadyRunning: return "already running";
    default:                           return "unknown";
  }
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error return type.
 *
 * Construct through the success() / error() factories. Accessing value() on
 * an error, or get_error() on a value, is a programming error (asserted).
 */
template <typename V, typename E>
class expected {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(&r.storage_)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) noexcept {
    expected r;
    ::new (static_cast<void*>(&r.storage_)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : error_(other.error_),
                                    has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_)) V(other.Ref());
    }
  }

  expected(expected&& other) noexcept : error_(other.error_),
                                        has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_)) V(std::move(other.Ref()));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_)) V(other.Ref());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_)) V(std::move(other.Ref()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() noexcept {
    NSPEED_ASSERT(has_value_);
    return Ref();
  }

  const V& value() const noexcept {
    NSPEED_ASSERT(has_value_);
    return Ref();
  }

  E get_error() const noexcept {
    NSPEED_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? Ref() : fallback;
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  V& Ref() noexcept { return *std::launder(reinterpret_cast<V*>(&storage_)); }
  const V& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E error_;
  bool has_value_;
};

/** @brief expected<void, E>: success carries no value. */
template <typename E>
class expected<void, E> {
 public:
  static expected success() noexcept { return expected(true, E()); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    NSPEED_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E e) noexcept : error_(e), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable on scope exit unless released.
 *
 * @code
 *   NSPEED_SCOPE_EXIT(server.Stop());
 * @endcode
 */
template <typename F>
class ScopeGuard {
 public:
  explicit ScopeGuard(F fn) noexcept : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  /** @brief Disarm the guard. */
  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<typename std::decay<F>::type> MakeScopeGuard(F&& fn) noexcept {
  return ScopeGuard<typename std::decay<F>::type>(std::forward<F>(fn));
}

#define NSPEED_SCOPE_EXIT(...)                          \
  auto NSPEED_CONCAT(nspeed_scope_exit_, __LINE__) =    \
      ::nspeed::MakeScopeGuard([&]() { __VA_ARGS__; })

}  // namespace nspeed

#endif  // NSPEED_VOCABULARY_HPP_
