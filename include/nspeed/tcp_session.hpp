/**
 * @file tcp_session.hpp
 * @brief TCP download: filler-byte server and measuring client.
 *
 * Control channel: the client sends one ASCII decimal size terminated by
 * '\n'; the server answers with exactly that many 'a' bytes and closes.
 */

#ifndef NSPEED_TCP_SESSION_HPP_
#define NSPEED_TCP_SESSION_HPP_

#include "nspeed/log.hpp"
#include "nspeed/platform.hpp"
#include "nspeed/socket.hpp"
#include "nspeed/stats.hpp"
#include "nspeed/vocabulary.hpp"

#if NSPEED_HAS_NETWORK

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace nspeed {

/// Longest request line, newline excluded.
constexpr uint32_t kMaxRequestLine = 32U;

/**
 * @brief Parse a request line ("1000000", "  42 ", "-5").
 *
 * A leading '-' denotes a non-positive size and maps to 0. A trailing '\r'
 * and surrounding blanks are allowed.
 * @return false when no digits are present or other characters appear.
 */
inline bool ParseRequestLine(const char* line, uint64_t& out) noexcept {
  if (line == nullptr) return false;
  const char* p = line;
  while (*p == ' ' || *p == '\t') ++p;
  bool negative = false;
  if (*p == '-' || *p == '+') {
    negative = (*p == '-');
    ++p;
  }
  if (*p < '0' || *p > '9') return false;
  uint64_t v = 0;
  while (*p >= '0' && *p <= '9') {
    const uint64_t digit = static_cast<uint64_t>(*p - '0');
    if (v > (UINT64_MAX - digit) / 10U) return false;
    v = v * 10U + digit;
    ++p;
  }
  while (*p == ' ' || *p == '\t' || *p == '\r') ++p;
  if (*p != '\0') return false;
  out = negative ? 0U : v;
  return true;
}

// ============================================================================
// TcpTransferServer
// ============================================================================

/**
 * @brief Accepts download connections and serves each on its own thread.
 *
 * The accept loop never blocks on a transfer; finished workers are reaped
 * on the next accept iteration.
 */
class TcpTransferServer {
 public:
  struct Config {
    uint16_t port = 0;                  ///< 0 = ephemeral.
    int32_t backlog = 999;
    uint32_t chunk_size = 4096U;
    uint32_t accept_timeout_ms = 200U;  ///< Bounds how long Stop() waits.
    uint32_t request_timeout_ms = 10000U;
  };

  explicit TcpTransferServer(const Config& cfg) noexcept
      : config_(cfg), running_(false), served_(0), bytes_sent_(0) {}

  ~TcpTransferServer() { Stop(); }

  TcpTransferServer(const TcpTransferServer&) = delete;
  TcpTransferServer& operator=(const TcpTransferServer&) = delete;
  TcpTransferServer(TcpTransferServer&&) = delete;
  TcpTransferServer& operator=(TcpTransferServer&&) = delete;

  /**
   * @brief Bind, listen and spawn the accept thread.
   * @return Success or ServerError.
   */
  expected<void, ServerError> Start() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, ServerError>::error(ServerError::kAlreadyRunning);
    }
    auto created = TcpListener::Create();
    if (!created.has_value()) {
      return expected<void, ServerError>::error(ServerError::kSocketFailed);
    }
    TcpListener& l = created.value();
    if (!l.SetReuseAddr(true).has_value() ||
        !l.SetAcceptTimeout(config_.accept_timeout_ms).has_value()) {
      return expected<void, ServerError>::error(ServerError::kSetOptFailed);
    }
    if (!l.Bind(SocketAddress::Any(config_.port)).has_value()) {
      return expected<void, ServerError>::error(ServerError::kBindFailed);
    }
    if (!l.Listen(config_.backlog).has_value()) {
      return expected<void, ServerError>::error(ServerError::kListenFailed);
    }
    listener_ = std::move(l);

    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
    return expected<void, ServerError>::success();
  }

  /** @brief Stop accepting, abort in-flight transfers and join all threads. */
  void Stop() noexcept {
    if (!running_.load(std::memory_order_acquire)) return;
    running_.store(false, std::memory_order_release);
    listener_.Shutdown();
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& entry : workers_) {
      if (entry.thread.joinable()) {
        entry.thread.join();
      }
    }
    workers_.clear();
    listener_.Close();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint16_t Port() const noexcept { return listener_.LocalPort(); }

  uint64_t ConnectionsServed() const noexcept {
    return served_.load(std::memory_order_relaxed);
  }

  uint64_t BytesSent() const noexcept {
    return bytes_sent_.load(std::memory_order_relaxed);
  }

 private:
  struct WorkerEntry {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void ReapFinishedWorkers() noexcept {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (uint32_t i = 0; i < workers_.size();) {
      if (workers_[i].finished->load(std::memory_order_acquire)) {
        if (workers_[i].thread.joinable()) {
          workers_[i].thread.join();
        }
        workers_[i] = std::move(workers_.back());
        workers_.pop_back();
      } else {
        ++i;
      }
    }
  }

  void AcceptLoop() noexcept {
    while (running_.load(std::memory_order_acquire)) {
      ReapFinishedWorkers();

      SocketAddress peer;
      auto conn = listener_.Accept(peer);
      if (!conn.has_value()) {
        if (!running_.load(std::memory_order_acquire)) break;
        if (conn.get_error() != SocketError::kWouldBlock) {
          NSPEED_LOG_WARN("TCP", "accept failed: %s",
                          SocketErrorName(conn.get_error()));
        }
        continue;
      }

      auto finished = std::make_shared<std::atomic<bool>>(false);
      std::lock_guard<std::mutex> lock(workers_mutex_);
      workers_.push_back(WorkerEntry{
          std::thread([this, sock = std::move(conn.value()), peer,
                       finished]() mutable {
            HandleConnection(sock, peer);
            finished->store(true, std::memory_order_release);
          }),
          finished});
    }
  }

  /// Read one newline-terminated line; false on EOF, error or overlong line.
  static bool ReadRequestLine(TcpSocket& sock, char* line) noexcept {
    uint32_t len = 0;
    for (;;) {
      char c = 0;
      auto n = sock.Recv(&c, 1);
      if (!n.has_value() || n.value() == 0) return false;
      if (c == '\n') break;
      if (len >= kMaxRequestLine) return false;
      line[len++] = c;
    }
    line[len] = '\0';
    return true;
  }

  void HandleConnection(TcpSocket& sock, const SocketAddress& peer) noexcept {
    char ip[INET_ADDRSTRLEN];
    (void)peer.Ip(ip, sizeof(ip));
    (void)sock.SetRecvTimeout(config_.request_timeout_ms);

    char line[kMaxRequestLine + 1U];
    uint64_t requested = 0;
    if (!ReadRequestLine(sock, line)) {
      NSPEED_LOG_WARN("TCP", "bad or missing request line from %s:%u", ip,
                      static_cast<unsigned>(peer.Port()));
      return;
    }
    if (!ParseRequestLine(line, requested)) {
      NSPEED_LOG_WARN("TCP", "non-numeric request '%s' from %s:%u", line, ip,
                      static_cast<unsigned>(peer.Port()));
      return;
    }
    NSPEED_LOG_DEBUG("TCP", "%s:%u requested %llu bytes", ip,
                     static_cast<unsigned>(peer.Port()),
                     static_cast<unsigned long long>(requested));

    std::vector<char> chunk(config_.chunk_size, kFillerByte);
    uint64_t remaining = requested;
    while (remaining > 0U && running_.load(std::memory_order_acquire)) {
      const size_t n = static_cast<size_t>(
          std::min<uint64_t>(remaining, chunk.size()));
      auto r = sock.SendAll(chunk.data(), n);
      if (!r.has_value()) {
        NSPEED_LOG_DEBUG("TCP", "%s:%u went away with %llu bytes unsent", ip,
                         static_cast<unsigned>(peer.Port()),
                         static_cast<unsigned long long>(remaining));
        break;
      }
      remaining -= n;
      bytes_sent_.fetch_add(n, std::memory_order_relaxed);
    }
    served_.fetch_add(1, std::memory_order_relaxed);
  }

  Config config_;
  TcpListener listener_;
  std::atomic<bool> running_;
  std::atomic<uint64_t> served_;
  std::atomic<uint64_t> bytes_sent_;
  std::thread accept_thread_;
  std::vector<WorkerEntry> workers_;
  std::mutex workers_mutex_;
};

// ============================================================================
// RunTcpDownload
// ============================================================================

/**
 * @brief Download @p file_size bytes from host:port and time it.
 *
 * The timer starts before connect. Reading stops at the requested count or
 * when the peer closes; an early close is a completed transfer with the
 * bytes actually received.
 */
inline expected<TcpStats, SessionError> RunTcpDownload(
    const char* host, uint16_t port, uint64_t file_size,
    uint32_t connection_id) noexcept {
  const uint64_t start_ns = SteadyNowNs();

  auto addr = SocketAddress::FromIpv4(host, port);
  if (!addr.has_value()) {
    return expected<TcpStats, SessionError>::error(
        SessionError::kInvalidAddress);
  }
  auto created = TcpSocket::Create();
  if (!created.has_value()) {
    return expected<TcpStats, SessionError>::error(SessionError::kSocketFailed);
  }
  TcpSocket& sock = created.value();
  if (!sock.Connect(addr.value()).has_value()) {
    return expected<TcpStats, SessionError>::error(
        SessionError::kConnectFailed);
  }

  char line[32];
  const int len = std::snprintf(line, sizeof(line), "%llu\n",
                                static_cast<unsigned long long>(file_size));
  if (!sock.SendAll(line, static_cast<size_t>(len)).has_value()) {
    return expected<TcpStats, SessionError>::error(SessionError::kSendFailed);
  }

  uint8_t buf[4096];
  uint64_t received = 0;
  while (received < file_size) {
    const size_t want = static_cast<size_t>(
        std::min<uint64_t>(file_size - received, sizeof(buf)));
    auto n = sock.Recv(buf, want);
    if (!n.has_value()) {
      return expected<TcpStats, SessionError>::error(SessionError::kRecvFailed);
    }
    if (n.value() == 0) break;
    received += static_cast<uint64_t>(n.value());
  }

  TcpStats stats;
  stats.connection_id = connection_id;
  stats.requested_bytes = file_size;
  stats.bytes_received = received;
  stats.elapsed_s = ClampElapsed(
      static_cast<double>(SteadyNowNs() - start_ns) / 1e9);
  return expected<TcpStats, SessionError>::success(stats);
}

}  // namespace nspeed

#endif  // NSPEED_HAS_NETWORK

#endif  // NSPEED_TCP_SESSION_HPP_
