/**
 * @file discovery.hpp
 * @brief UDP broadcast discovery of a speed-test server's ephemeral ports.
 *
 * OfferBroadcaster (server role) announces an Offer every interval;
 * OfferListener (client role) decodes Offers on the well-known broadcast
 * port and hands each one to a callback.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef NSPEED_DISCOVERY_HPP_
#define NSPEED_DISCOVERY_HPP_

#include "nspeed/log.hpp"
#include "nspeed/platform.hpp"
#include "nspeed/socket.hpp"
#include "nspeed/vocabulary.hpp"
#include "nspeed/wire_codec.hpp"

#if NSPEED_HAS_NETWORK

#include <arpa/inet.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace nspeed {

// ============================================================================
// Discovery Error
// ============================================================================

enum class DiscoveryError : uint8_t {
  kSocketFailed = 0,
  kBindFailed,
  kSetOptFailed,
  kInvalidAddress,
  kAlreadyRunning,
};

inline const char* DiscoveryErrorName(DiscoveryError e) noexcept {
  switch (e) {
    case DiscoveryError::kSocketFailed:    return "socket failed";
    case DiscoveryError::kBindFailed:      return "bind failed";
    case DiscoveryError::kSetOptFailed:    return "setsockopt failed";
    case DiscoveryError::kInvalidAddress:  return "invalid address";
    case DiscoveryError::kAlreadyRunning:  return "already running";
    default:                               return "unknown";
  }
}

// ============================================================================
// ServerOffer
// ============================================================================

/// A decoded Offer together with the address it came from.
struct ServerOffer {
  char address[INET_ADDRSTRLEN];
  uint16_t udp_port;
  uint16_t tcp_port;

  ServerOffer() noexcept : address{}, udp_port(0), tcp_port(0) {}
};

// ============================================================================
// OfferBroadcaster
// ============================================================================

class OfferBroadcaster {
 public:
  struct Config {
    WireConstants wire;
    uint16_t udp_port = 0;
    uint16_t tcp_port = 0;
    uint16_t broadcast_port = 13117U;
    const char* broadcast_address = "255.255.255.255";
    uint32_t interval_ms = 1000U;
  };

  explicit OfferBroadcaster(const Config& cfg) noexcept
      : config_(cfg), running_(false), sent_(0), failures_(0) {}

  ~OfferBroadcaster() { Stop(); }

  OfferBroadcaster(const OfferBroadcaster&) = delete;
  OfferBroadcaster& operator=(const OfferBroadcaster&) = delete;
  OfferBroadcaster(OfferBroadcaster&&) = delete;
  OfferBroadcaster& operator=(OfferBroadcaster&&) = delete;

  /**
   * @brief Open the broadcast socket and spawn the announce thread.
   * @return Success or DiscoveryError.
   */
  expected<void, DiscoveryError> Start() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kAlreadyRunning);
    }
    auto dest = SocketAddress::FromIpv4(config_.broadcast_address,
                                        config_.broadcast_port);
    if (!dest.has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kInvalidAddress);
    }
    auto sock = UdpSocket::Create();
    if (!sock.has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSocketFailed);
    }
    if (!sock.value().SetBroadcast(true).has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSetOptFailed);
    }
    sock_ = std::move(sock.value());
    dest_ = dest.value();

    running_.store(true, std::memory_order_release);
    announce_thread_ = std::thread([this]() { AnnounceLoop(); });
    return expected<void, DiscoveryError>::success();
  }

  /** @brief Stop announcing; returns without waiting out the interval. */
  void Stop() noexcept {
    if (!running_.load(std::memory_order_acquire)) return;
    {
      std::lock_guard<std::mutex> lock(wait_mutex_);
      running_.store(false, std::memory_order_release);
    }
    wait_cv_.notify_all();
    if (announce_thread_.joinable()) {
      announce_thread_.join();
    }
    sock_.Close();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint64_t OffersSent() const noexcept {
    return sent_.load(std::memory_order_relaxed);
  }

  uint64_t SendFailures() const noexcept {
    return failures_.load(std::memory_order_relaxed);
  }

 private:
  void AnnounceLoop() noexcept {
    uint8_t packet[kOfferSize];
    OfferMessage offer;
    offer.udp_port = config_.udp_port;
    offer.tcp_port = config_.tcp_port;
    auto n = EncodeOffer(offer, packet, sizeof(packet), config_.wire);
    if (!n.has_value()) {
      NSPEED_LOG_ERROR("DISCOVERY", "offer encode failed: %s",
                       WireErrorName(n.get_error()));
      return;
    }

    while (running_.load(std::memory_order_acquire)) {
      auto r = sock_.SendTo(packet, n.value(), dest_);
      if (r.has_value()) {
        sent_.fetch_add(1, std::memory_order_relaxed);
      } else {
        failures_.fetch_add(1, std::memory_order_relaxed);
        NSPEED_LOG_WARN("DISCOVERY", "offer broadcast failed: %s",
                        SocketErrorName(r.get_error()));
      }

      std::unique_lock<std::mutex> lock(wait_mutex_);
      wait_cv_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                        [this]() {
                          return !running_.load(std::memory_order_acquire);
                        });
    }
  }

  Config config_;
  UdpSocket sock_;
  SocketAddress dest_;
  std::atomic<bool> running_;
  std::atomic<uint64_t> sent_;
  std::atomic<uint64_t> failures_;
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::thread announce_thread_;
};

// ============================================================================
// OfferListener
// ============================================================================

class OfferListener {
 public:
  using OfferCallback = void (*)(const ServerOffer&, void*);

  struct Config {
    WireConstants wire;
    uint16_t broadcast_port = 13117U;  ///< 0 binds an ephemeral port.
    uint32_t poll_timeout_ms = 200U;   ///< Bounds how long Stop() waits.
  };

  explicit OfferListener(const Config& cfg) noexcept
      : config_(cfg),
        running_(false),
        on_offer_(nullptr),
        offer_ctx_(nullptr),
        received_(0),
        dropped_(0) {}

  ~OfferListener() { Stop(); }

  OfferListener(const OfferListener&) = delete;
  OfferListener& operator=(const OfferListener&) = delete;
  OfferListener(OfferListener&&) = delete;
  OfferListener& operator=(OfferListener&&) = delete;

  /**
   * @brief Set callback for each valid Offer.
   *
   * Runs on the receive thread; it must hand long work to another thread.
   */
  void SetOnOffer(OfferCallback cb, void* ctx = nullptr) noexcept {
    on_offer_ = cb;
    offer_ctx_ = ctx;
  }

  expected<void, DiscoveryError> Start() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kAlreadyRunning);
    }
    auto sock = UdpSocket::Create();
    if (!sock.has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSocketFailed);
    }
    UdpSocket& s = sock.value();
    if (!s.SetReuseAddr(true).has_value() || !s.SetReusePort(true).has_value() ||
        !s.SetRecvTimeout(config_.poll_timeout_ms).has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSetOptFailed);
    }
    if (!s.Bind(SocketAddress::Any(config_.broadcast_port)).has_value()) {
      return expected<void, DiscoveryError>::error(DiscoveryError::kBindFailed);
    }
    sock_ = std::move(s);

    running_.store(true, std::memory_order_release);
    receive_thread_ = std::thread([this]() { ReceiveLoop(); });
    return expected<void, DiscoveryError>::success();
  }

  void Stop() noexcept {
    if (!running_.load(std::memory_order_acquire)) return;
    running_.store(false, std::memory_order_release);
    if (receive_thread_.joinable()) {
      receive_thread_.join();
    }
    sock_.Close();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /** @brief Bound port (useful when using port 0 for OS-assigned). */
  uint16_t LocalPort() const noexcept { return sock_.LocalPort(); }

  uint64_t OffersReceived() const noexcept {
    return received_.load(std::memory_order_relaxed);
  }

  /// Datagrams on the broadcast port that did not decode as an Offer.
  uint64_t DroppedCount() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
  }

 private:
  static constexpr uint32_t kRecvBufferSize = 1500U;

  void ReceiveLoop() noexcept {
    uint8_t packet[kRecvBufferSize];

    while (running_.load(std::memory_order_acquire)) {
      SocketAddress sender;
      auto n = sock_.RecvFrom(packet, sizeof(packet), sender);
      if (!n.has_value()) {
        if (n.get_error() != SocketError::kWouldBlock) {
          NSPEED_LOG_WARN("DISCOVERY", "receive failed: %s",
                          SocketErrorName(n.get_error()));
          std::this_thread::sleep_for(
              std::chrono::milliseconds(config_.poll_timeout_ms));
        }
        continue;
      }

      auto offer = DecodeOffer(packet, static_cast<uint32_t>(n.value()),
                               config_.wire);
      if (!offer.has_value()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        NSPEED_LOG_DEBUG("DISCOVERY", "dropped %d-byte datagram: %s",
                         n.value(), WireErrorName(offer.get_error()));
        continue;
      }

      ServerOffer so;
      (void)sender.Ip(so.address, sizeof(so.address));
      so.udp_port = offer.value().udp_port;
      so.tcp_port = offer.value().tcp_port;
      received_.fetch_add(1, std::memory_order_relaxed);

      if (on_offer_ != nullptr) {
        on_offer_(so, offer_ctx_);
      }
    }
  }

  Config config_;
  UdpSocket sock_;
  std::atomic<bool> running_;
  OfferCallback on_offer_;
  void* offer_ctx_;
  std::atomic<uint64_t> received_;
  std::atomic<uint64_t> dropped_;
  std::thread receive_thread_;
};

}  // namespace nspeed

#endif  // NSPEED_HAS_NETWORK

#endif  // NSPEED_DISCOVERY_HPP_
