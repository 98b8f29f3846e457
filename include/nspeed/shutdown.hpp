/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM handling for the speed-test processes.
 *
 * Uses pipe(2) for async-signal-safe wakeup and sigaction(2) for signal
 * installation. Registered stop callbacks run in LIFO order on the thread
 * that called WaitForShutdown(), never inside the signal handler.
 *
 * Stop callbacks may block while in-flight transfers drain. A second signal
 * during that wait terminates the process at once with 128 + signo.
 */

#ifndef NSPEED_SHUTDOWN_HPP_
#define NSPEED_SHUTDOWN_HPP_

#include "nspeed/platform.hpp"
#include "nspeed/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <unistd.h>

namespace nspeed {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// Stop callback. Receives the signal number (0 for Quit()) and its context.
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may be active per process.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Turns SIGINT/SIGTERM into an orderly stop.
 *
 * @code
 *   nspeed::ShutdownManager mgr;
 *   mgr.Register([](int, void* p) { static_cast<Server*>(p)->Stop(); }, &srv);
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 8;

  ShutdownManager() noexcept
      : callback_count_(0), shutdown_flag_(false), valid_(false) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;

    // A second instance stays invalid and leaves the global pointer alone.
    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (pipe_fd_[0] >= 0) {
      ::close(pipe_fd_[0]);
    }
    if (pipe_fd_[1] >= 0) {
      ::close(pipe_fd_[1]);
    }
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn,
                                         void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_].fn = fn;
    callbacks_[callback_count_].ctx = ctx;
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  /** @brief Install handlers for SIGINT and SIGTERM (SA_RESTART). */
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /** @brief Request shutdown from code; idempotent. */
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /** @brief Block until a signal or Quit(), then run callbacks LIFO. */
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0) {
      uint8_t buf = 0;
      while (!shutdown_flag_.load(std::memory_order_acquire)) {
        if (::read(pipe_fd_[0], &buf, 1) < 0 && errno != EINTR) {
          break;
        }
      }
    }

    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = callback_count_; i > 0U; --i) {
      callbacks_[i - 1U].fn(signo, callbacks_[i - 1U].ctx);
    }
  }

  bool IsShutdownRequested() const noexcept {
    return shutdown_flag_.load(std::memory_order_acquire);
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  struct Entry {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  // Async-signal-safe: atomics, write(2) and _exit(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      if (self->shutdown_flag_.load(std::memory_order_acquire)) {
        ::_exit(128 + signo);
      }
      self->signo_.store(signo, std::memory_order_relaxed);
      self->shutdown_flag_.store(true, std::memory_order_release);
      self->Wake();
    }
  }

  Entry callbacks_[kMaxCallbacks];
  uint32_t callback_count_;
  std::atomic<bool> shutdown_flag_;
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  bool valid_;
};

}  // namespace nspeed

#endif  // NSPEED_SHUTDOWN_HPP_
