/**
 * @file udp_session.hpp
 * @brief Segmented UDP download: Request in, Payload stream out.
 *
 * The server answers each valid Request with Payload 1..N sent back to back
 * from its bound socket. The client counts what arrives until the line has
 * been idle for the configured timeout. There is no retransmission.
 */

#ifndef NSPEED_UDP_SESSION_HPP_
#define NSPEED_UDP_SESSION_HPP_

#include "nspeed/log.hpp"
#include "nspeed/platform.hpp"
#include "nspeed/socket.hpp"
#include "nspeed/stats.hpp"
#include "nspeed/vocabulary.hpp"
#include "nspeed/wire_codec.hpp"

#if NSPEED_HAS_NETWORK

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace nspeed {

/// Requested client receive buffer; the kernel caps it at rmem_max.
constexpr int32_t kUdpClientRecvBuffer = 4 * 1024 * 1024;

// ============================================================================
// UdpTransferServer
// ============================================================================

class UdpTransferServer {
 public:
  struct Config {
    WireConstants wire;
    uint16_t port = 0;                ///< 0 = ephemeral.
    uint32_t segment_size = kDefaultSegmentSize;
    uint32_t poll_timeout_ms = 200U;  ///< Bounds how long Stop() waits.
  };

  explicit UdpTransferServer(const Config& cfg) noexcept
      : config_(cfg),
        running_(false),
        requests_(0),
        dropped_(0),
        segments_sent_(0) {}

  ~UdpTransferServer() { Stop(); }

  UdpTransferServer(const UdpTransferServer&) = delete;
  UdpTransferServer& operator=(const UdpTransferServer&) = delete;
  UdpTransferServer(UdpTransferServer&&) = delete;
  UdpTransferServer& operator=(UdpTransferServer&&) = delete;

  expected<void, ServerError> Start() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, ServerError>::error(ServerError::kAlreadyRunning);
    }
    auto created = UdpSocket::Create();
    if (!created.has_value()) {
      return expected<void, ServerError>::error(ServerError::kSocketFailed);
    }
    UdpSocket& s = created.value();
    if (!s.SetRecvTimeout(config_.poll_timeout_ms).has_value()) {
      return expected<void, ServerError>::error(ServerError::kSetOptFailed);
    }
    if (!s.Bind(SocketAddress::Any(config_.port)).has_value()) {
      return expected<void, ServerError>::error(ServerError::kBindFailed);
    }
    sock_ = std::move(s);

    running_.store(true, std::memory_order_release);
    receive_thread_ = std::thread([this]() { ReceiveLoop(); });
    return expected<void, ServerError>::success();
  }

  /** @brief Stop receiving, cut short in-flight streams and join threads. */
  void Stop() noexcept {
    if (!running_.load(std::memory_order_acquire)) return;
    running_.store(false, std::memory_order_release);
    if (receive_thread_.joinable()) {
      receive_thread_.join();
    }
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& entry : workers_) {
      if (entry.thread.joinable()) {
        entry.thread.join();
      }
    }
    workers_.clear();
    sock_.Close();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint16_t Port() const noexcept { return sock_.LocalPort(); }

  uint64_t RequestsServed() const noexcept {
    return requests_.load(std::memory_order_relaxed);
  }

  /// Datagrams that did not decode as a Request.
  uint64_t DroppedCount() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
  }

  uint64_t SegmentsSent() const noexcept {
    return segments_sent_.load(std::memory_order_relaxed);
  }

 private:
  static constexpr uint32_t kRecvBufferSize = 1500U;

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

  void ReceiveLoop() noexcept {
    uint8_t packet[kRecvBufferSize];

    while (running_.load(std::memory_order_acquire)) {
      ReapFinishedWorkers();

      SocketAddress requester;
      auto n = sock_.RecvFrom(packet, sizeof(packet), requester);
      if (!n.has_value()) {
        if (n.get_error() != SocketError::kWouldBlock) {
          NSPEED_LOG_WARN("UDP", "receive failed: %s",
                          SocketErrorName(n.get_error()));
        }
        continue;
      }

      auto req = DecodeRequest(packet, static_cast<uint32_t>(n.value()),
                               config_.wire);
      if (!req.has_value()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        NSPEED_LOG_DEBUG("UDP", "dropped %d-byte datagram: %s", n.value(),
                         WireErrorName(req.get_error()));
        continue;
      }

      const uint64_t file_size = req.value().file_size;
      auto finished = std::make_shared<std::atomic<bool>>(false);
      std::lock_guard<std::mutex> lock(workers_mutex_);
      workers_.push_back(WorkerEntry{
          std::thread([this, file_size, requester, finished]() {
            SendSegments(file_size, requester);
            finished->store(true, std::memory_order_release);
          }),
          finished});
    }
  }

  void SendSegments(uint64_t file_size, const SocketAddress& dest) noexcept {
    char ip[INET_ADDRSTRLEN];
    (void)dest.Ip(ip, sizeof(ip));
    const uint64_t total = SegmentCount(file_size, config_.segment_size);
    NSPEED_LOG_DEBUG("UDP", "%s:%u requested %llu bytes (%llu segments)", ip,
                     static_cast<unsigned>(dest.Port()),
                     static_cast<unsigned long long>(file_size),
                     static_cast<unsigned long long>(total));
    requests_.fetch_add(1, std::memory_order_relaxed);

    std::vector<uint8_t> datagram(kPayloadHeaderSize + config_.segment_size,
                                  static_cast<uint8_t>(kFillerByte));
    uint64_t failures = 0;
    for (uint64_t index = 1; index <= total; ++index) {
      if (!running_.load(std::memory_order_acquire)) break;
      auto hdr = EncodePayloadHeader(total, index, datagram.data(),
                                     static_cast<uint32_t>(datagram.size()),
                                     config_.wire);
      if (!hdr.has_value()) {
        NSPEED_LOG_ERROR("UDP", "payload encode failed: %s",
                         WireErrorName(hdr.get_error()));
        return;
      }
      const uint32_t len = SegmentLength(index, file_size, config_.segment_size);
      auto r = sock_.SendTo(datagram.data(), kPayloadHeaderSize + len, dest);
      if (r.has_value()) {
        segments_sent_.fetch_add(1, std::memory_order_relaxed);
      } else {
        ++failures;
      }
    }
    if (failures > 0U) {
      NSPEED_LOG_WARN("UDP", "%llu of %llu segments to %s:%u failed to send",
                      static_cast<unsigned long long>(failures),
                      static_cast<unsigned long long>(total), ip,
                      static_cast<unsigned>(dest.Port()));
    }
  }

  Config config_;
  UdpSocket sock_;
  std::atomic<bool> running_;
  std::atomic<uint64_t> requests_;
  std::atomic<uint64_t> dropped_;
  std::atomic<uint64_t> segments_sent_;
  std::thread receive_thread_;
  std::vector<WorkerEntry> workers_;
  std::mutex workers_mutex_;
};

// ============================================================================
// RunUdpDownload
// ============================================================================

/**
 * @brief Request @p file_size bytes over UDP and count what arrives.
 *
 * Ends when nothing has arrived for @p idle_timeout_ms; that wait is part of
 * the elapsed time. Malformed datagrams are skipped.
 */
inline expected<UdpStats, SessionError> RunUdpDownload(
    const char* host, uint16_t port, uint64_t file_size,
    uint32_t connection_id, uint32_t idle_timeout_ms,
    const WireConstants& wire = {}) noexcept {
  const uint64_t start_ns = SteadyNowNs();

  auto addr = SocketAddress::FromIpv4(host, port);
  if (!addr.has_value()) {
    return expected<UdpStats, SessionError>::error(
        SessionError::kInvalidAddress);
  }
  auto created = UdpSocket::Create();
  if (!created.has_value()) {
    return expected<UdpStats, SessionError>::error(SessionError::kSocketFailed);
  }
  UdpSocket& sock = created.value();
  // A zero timeout would block forever.
  if (!sock.SetRecvTimeout(idle_timeout_ms == 0U ? 1U : idle_timeout_ms)
           .has_value()) {
    return expected<UdpStats, SessionError>::error(SessionError::kSocketFailed);
  }
  if (!sock.SetRecvBufferSize(kUdpClientRecvBuffer).has_value()) {
    NSPEED_LOG_DEBUG("UDP", "#%u: could not enlarge receive buffer",
                     connection_id);
  }

  uint8_t request[kRequestSize];
  RequestMessage req;
  req.file_size = file_size;
  auto n = EncodeRequest(req, request, sizeof(request), wire);
  if (!n.has_value()) {
    return expected<UdpStats, SessionError>::error(SessionError::kEncodeFailed);
  }
  if (!sock.SendTo(request, n.value(), addr.value()).has_value()) {
    return expected<UdpStats, SessionError>::error(SessionError::kSendFailed);
  }

  std::vector<uint8_t> buf(kMaxDatagramSize);
  UdpReceiveTally tally;
  for (;;) {
    SocketAddress src;
    auto got = sock.RecvFrom(buf.data(), buf.size(), src);
    if (!got.has_value()) {
      if (got.get_error() == SocketError::kWouldBlock) break;
      return expected<UdpStats, SessionError>::error(SessionError::kRecvFailed);
    }
    auto payload = DecodePayload(buf.data(), static_cast<uint32_t>(got.value()),
                                 wire);
    if (!payload.has_value()) continue;
    tally.OnPayload(payload.value().total_segments, payload.value().data_len);
  }

  const double elapsed = static_cast<double>(SteadyNowNs() - start_ns) / 1e9;
  return expected<UdpStats, SessionError>::success(
      tally.ToStats(connection_id, file_size, elapsed));
}

}  // namespace nspeed

#endif  // NSPEED_HAS_NETWORK

#endif  // NSPEED_UDP_SESSION_HPP_
