/**
 * @file session.hpp
 * @brief Runs one speed-test session against a discovered server.
 *
 * A session is N TCP downloads and M UDP downloads started together against
 * the ports of one Offer. Connection ids run 1..N per transport. The caller
 * gets a SessionReport once every transfer has finished; progress is
 * reported through a SessionEvent sink.
 */

#ifndef NSPEED_SESSION_HPP_
#define NSPEED_SESSION_HPP_

#include "nspeed/discovery.hpp"
#include "nspeed/log.hpp"
#include "nspeed/stats.hpp"
#include "nspeed/tcp_session.hpp"
#include "nspeed/udp_session.hpp"
#include "nspeed/vocabulary.hpp"
#include "nspeed/wire_codec.hpp"

#if NSPEED_HAS_NETWORK

#include <thread>
#include <vector>

namespace nspeed {

// ============================================================================
// Plan and results
// ============================================================================

struct SessionPlan {
  WireConstants wire;
  uint64_t file_size = 1000000U;
  uint32_t tcp_connections = 1U;
  uint32_t udp_connections = 1U;
  uint32_t udp_idle_timeout_ms = 1000U;
};

enum class Transport : uint8_t { kTcp = 0, kUdp };

struct TcpResult {
  uint32_t connection_id = 0;
  bool ok = false;
  SessionError error = SessionError::kSocketFailed;
  TcpStats stats;
};

struct UdpResult {
  uint32_t connection_id = 0;
  bool ok = false;
  SessionError error = SessionError::kSocketFailed;
  UdpStats stats;
};

struct SessionReport {
  ServerOffer offer;
  std::vector<TcpResult> tcp;  ///< Indexed by connection id - 1.
  std::vector<UdpResult> udp;

  uint32_t Failures() const noexcept {
    uint32_t n = 0;
    for (const auto& r : tcp) n += r.ok ? 0U : 1U;
    for (const auto& r : udp) n += r.ok ? 0U : 1U;
    return n;
  }

  uint64_t TotalBytes() const noexcept {
    uint64_t n = 0;
    for (const auto& r : tcp) n += r.ok ? r.stats.bytes_received : 0U;
    for (const auto& r : udp) n += r.ok ? r.stats.bytes_received : 0U;
    return n;
  }
};

// ============================================================================
// Events
// ============================================================================

enum class SessionEventKind : uint8_t {
  kOfferReceived = 0,
  kSessionStarted,
  kTcpFinished,
  kUdpFinished,
  kTransferFailed,
  kAllComplete,
};

/**
 * @brief One progress record. Pointer fields are valid only during the call
 * and only for the kinds that carry them.
 */
struct SessionEvent {
  SessionEventKind kind = SessionEventKind::kOfferReceived;
  const ServerOffer* offer = nullptr;
  Transport transport = Transport::kTcp;
  uint32_t connection_id = 0;
  uint32_t tcp_connections = 0;
  uint32_t udp_connections = 0;
  const TcpStats* tcp = nullptr;
  const UdpStats* udp = nullptr;
  SessionError error = SessionError::kSocketFailed;
};

/// Called from transfer threads concurrently; must be thread-safe.
using SessionEventFn = void (*)(const SessionEvent&, void*);

/** @brief Default sink: one log line per event. */
inline void LogSessionEvent(const SessionEvent& e, void* /*ctx*/) {
  switch (e.kind) {
    case SessionEventKind::kOfferReceived:
      NSPEED_LOG_INFO("CLIENT", "Received offer from %s (UDP port %u, TCP port %u)",
                      e.offer->address, static_cast<unsigned>(e.offer->udp_port),
                      static_cast<unsigned>(e.offer->tcp_port));
      break;
    case SessionEventKind::kSessionStarted:
      NSPEED_LOG_INFO("CLIENT",
                      "Connecting to server %s on UDP=%u, TCP=%u (%u TCP, %u UDP)",
                      e.offer->address, static_cast<unsigned>(e.offer->udp_port),
                      static_cast<unsigned>(e.offer->tcp_port), e.tcp_connections,
                      e.udp_connections);
      break;
    case SessionEventKind::kTcpFinished:
      NSPEED_LOG_INFO("CLIENT",
                      "TCP #%u finished. Time: %.2fs, Speed: %.2f bps, Bytes: %llu",
                      e.connection_id, e.tcp->elapsed_s, e.tcp->BitsPerSecond(),
                      static_cast<unsigned long long>(e.tcp->bytes_received));
      break;
    case SessionEventKind::kUdpFinished:
      NSPEED_LOG_INFO("CLIENT",
                      "UDP #%u finished. Time: %.2fs, Speed: %.2f bps, Bytes: %llu, "
                      "Packets: %llu/%llu (%.2f%% OK)",
                      e.connection_id, e.udp->elapsed_s, e.udp->BitsPerSecond(),
                      static_cast<unsigned long long>(e.udp->bytes_received),
                      static_cast<unsigned long long>(e.udp->segments_received),
                      static_cast<unsigned long long>(e.udp->segments_expected),
                      e.udp->SuccessPercent());
      break;
    case SessionEventKind::kTransferFailed:
      NSPEED_LOG_ERROR("CLIENT", "%s download error (#%u): %s",
                       (e.transport == Transport::kTcp) ? "TCP" : "UDP",
                       e.connection_id, SessionErrorName(e.error));
      break;
    case SessionEventKind::kAllComplete:
      NSPEED_LOG_INFO("CLIENT",
                      "All transfers complete, listening for offer requests...");
      break;
    default:
      break;
  }
}

// ============================================================================
// SessionOrchestrator
// ============================================================================

class SessionOrchestrator {
 public:
  explicit SessionOrchestrator(const SessionPlan& plan) noexcept
      : plan_(plan), sink_(&LogSessionEvent), sink_ctx_(nullptr) {}

  /** @brief Replace the event sink; nullptr silences events. */
  void SetEventSink(SessionEventFn fn, void* ctx = nullptr) noexcept {
    sink_ = fn;
    sink_ctx_ = ctx;
  }

  const SessionPlan& Plan() const noexcept { return plan_; }

  /**
   * @brief Run every transfer of the plan against @p offer and wait.
   *
   * All transfers start together; TCP threads are joined before UDP ones.
   * A failing transfer only marks its own result.
   */
  SessionReport Run(const ServerOffer& offer) {
    SessionReport report;
    report.offer = offer;
    report.tcp.resize(plan_.tcp_connections);
    report.udp.resize(plan_.udp_connections);

    SessionEvent started;
    started.kind = SessionEventKind::kSessionStarted;
    started.offer = &report.offer;
    started.tcp_connections = plan_.tcp_connections;
    started.udp_connections = plan_.udp_connections;
    Emit(started);

    std::vector<std::thread> tcp_threads;
    tcp_threads.reserve(plan_.tcp_connections);
    for (uint32_t i = 0; i < plan_.tcp_connections; ++i) {
      TcpResult* slot = &report.tcp[i];
      slot->connection_id = i + 1U;
      tcp_threads.emplace_back([this, slot, &report]() {
        RunTcp(report.offer, *slot);
      });
    }

    std::vector<std::thread> udp_threads;
    udp_threads.reserve(plan_.udp_connections);
    for (uint32_t i = 0; i < plan_.udp_connections; ++i) {
      UdpResult* slot = &report.udp[i];
      slot->connection_id = i + 1U;
      udp_threads.emplace_back([this, slot, &report]() {
        RunUdp(report.offer, *slot);
      });
    }

    for (auto& t : tcp_threads) t.join();
    for (auto& t : udp_threads) t.join();

    SessionEvent done;
    done.kind = SessionEventKind::kAllComplete;
    done.offer = &report.offer;
    Emit(done);
    return report;
  }

 private:
  void Emit(const SessionEvent& e) const {
    if (sink_ != nullptr) {
      sink_(e, sink_ctx_);
    }
  }

  void RunTcp(const ServerOffer& offer, TcpResult& out) const {
    auto r = RunTcpDownload(offer.address, offer.tcp_port, plan_.file_size,
                            out.connection_id);
    SessionEvent e;
    e.offer = &offer;
    e.transport = Transport::kTcp;
    e.connection_id = out.connection_id;
    if (r.has_value()) {
      out.ok = true;
      out.stats = r.value();
      e.kind = SessionEventKind::kTcpFinished;
      e.tcp = &out.stats;
    } else {
      out.error = r.get_error();
      e.kind = SessionEventKind::kTransferFailed;
      e.error = out.error;
    }
    Emit(e);
  }

  void RunUdp(const ServerOffer& offer, UdpResult& out) const {
    auto r = RunUdpDownload(offer.address, offer.udp_port, plan_.file_size,
                            out.connection_id, plan_.udp_idle_timeout_ms,
                            plan_.wire);
    SessionEvent e;
    e.offer = &offer;
    e.transport = Transport::kUdp;
    e.connection_id = out.connection_id;
    if (r.has_value()) {
      out.ok = true;
      out.stats = r.value();
      e.kind = SessionEventKind::kUdpFinished;
      e.udp = &out.stats;
    } else {
      out.error = r.get_error();
      e.kind = SessionEventKind::kTransferFailed;
      e.error = out.error;
    }
    Emit(e);
  }

  SessionPlan plan_;
  SessionEventFn sink_;
  void* sink_ctx_;
};

}  // namespace nspeed

#endif  // NSPEED_HAS_NETWORK

#endif  // NSPEED_SESSION_HPP_
