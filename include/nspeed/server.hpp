/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file server.hpp
 * @brief Speed-test server: TCP and UDP transfer servers plus the broadcaster.
 *
 * Both transfer servers bind ephemeral ports; the broadcaster then announces
 * those ports until Stop().
 */

#ifndef NSPEED_SERVER_HPP_
#define NSPEED_SERVER_HPP_

#include "nspeed/discovery.hpp"
#include "nspeed/log.hpp"
#include "nspeed/settings.hpp"
#include "nspeed/socket.hpp"
#include "nspeed/tcp_session.hpp"
#include "nspeed/udp_session.hpp"
#include "nspeed/vocabulary.hpp"

#if NSPEED_HAS_NETWORK

#include <memory>

namespace nspeed {

class SpeedTestServer {
 public:
  explicit SpeedTestServer(const Settings& settings) noexcept
      : settings_(settings), running_(false) {}

  ~SpeedTestServer() { Stop(); }

  SpeedTestServer(const SpeedTestServer&) = delete;
  SpeedTestServer& operator=(const SpeedTestServer&) = delete;

  /**
   * @brief Bind both transfer servers, then start broadcasting offers.
   *
   * On failure everything already started is stopped again.
   */
  expected<void, ServerError> Start() noexcept {
    if (running_) {
      return expected<void, ServerError>::error(ServerError::kAlreadyRunning);
    }

    TcpTransferServer::Config tcp_cfg;
    tcp_cfg.backlog = settings_.max_tcp_connections;
    tcp_cfg.chunk_size = settings_.tcp_chunk_size;
    tcp_ = std::make_unique<TcpTransferServer>(tcp_cfg);

    UdpTransferServer::Config udp_cfg;
    udp_cfg.wire = settings_.wire;
    udp_cfg.segment_size = settings_.segment_size;
    udp_ = std::make_unique<UdpTransferServer>(udp_cfg);

    auto scope = MakeScopeGuard([this]() { StopAll(); });

    auto r = tcp_->Start();
    if (!r.has_value()) {
      NSPEED_LOG_ERROR("SERVER", "TCP server failed to start: %s",
                       ServerErrorName(r.get_error()));
      return r;
    }
    r = udp_->Start();
    if (!r.has_value()) {
      NSPEED_LOG_ERROR("SERVER", "UDP server failed to start: %s",
                       ServerErrorName(r.get_error()));
      return r;
    }

    OfferBroadcaster::Config bc_cfg;
    bc_cfg.wire = settings_.wire;
    bc_cfg.udp_port = udp_->Port();
    bc_cfg.tcp_port = tcp_->Port();
    bc_cfg.broadcast_port = settings_.broadcast_port;
    bc_cfg.broadcast_address = settings_.broadcast_address;
    bc_cfg.interval_ms = settings_.BroadcastIntervalMs();
    broadcaster_ = std::make_unique<OfferBroadcaster>(bc_cfg);
    auto b = broadcaster_->Start();
    if (!b.has_value()) {
      NSPEED_LOG_ERROR("SERVER", "offer broadcaster failed to start: %s",
                       DiscoveryErrorName(b.get_error()));
      return expected<void, ServerError>::error(ServerError::kSocketFailed);
    }
    scope.release();
    running_ = true;

    char ip[INET_ADDRSTRLEN];
    NSPEED_LOG_INFO("SERVER",
                    "Server started, listening on IP address %s "
                    "(TCP Port=%u, UDP Port=%u)",
                    LocalIpv4(ip, sizeof(ip)), static_cast<unsigned>(TcpPort()),
                    static_cast<unsigned>(UdpPort()));
    return expected<void, ServerError>::success();
  }

  void Stop() noexcept {
    if (!running_) return;
    running_ = false;
    StopAll();
    NSPEED_LOG_INFO("SERVER", "Server shutting down.");
  }

  bool IsRunning() const noexcept { return running_; }

  uint16_t TcpPort() const noexcept { return tcp_ ? tcp_->Port() : 0U; }
  uint16_t UdpPort() const noexcept { return udp_ ? udp_->Port() : 0U; }

  const TcpTransferServer* Tcp() const noexcept { return tcp_.get(); }
  const UdpTransferServer* Udp() const noexcept { return udp_.get(); }
  const OfferBroadcaster* Broadcaster() const noexcept {
    return broadcaster_.get();
  }

 private:
  // Broadcaster first so no offer names a port that is going away.
  void StopAll() noexcept {
    if (broadcaster_) broadcaster_->Stop();
    if (tcp_) tcp_->Stop();
    if (udp_) udp_->Stop();
  }

  Settings settings_;
  bool running_;
  std::unique_ptr<TcpTransferServer> tcp_;
  std::unique_ptr<UdpTransferServer> udp_;
  std::unique_ptr<OfferBroadcaster> broadcaster_;
};

}  // namespace nspeed

#endif  // NSPEED_HAS_NETWORK

#endif  // NSPEED_SERVER_HPP_
