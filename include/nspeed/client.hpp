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
 * @file client.hpp
 * @brief Speed-test client: listens for offers and runs one session per offer.
 *
 * Every valid Offer starts a SessionOrchestrator on its own thread, so the
 * listener keeps receiving while sessions run. Offers carry no session
 * identity: N offers start N concurrent sessions.
 */

#ifndef NSPEED_CLIENT_HPP_
#define NSPEED_CLIENT_HPP_

#include "nspeed/discovery.hpp"
#include "nspeed/log.hpp"
#include "nspeed/session.hpp"
#include "nspeed/settings.hpp"
#include "nspeed/vocabulary.hpp"

#if NSPEED_HAS_NETWORK

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace nspeed {

class SpeedTestClient {
 public:
  using ReportFn = void (*)(const SessionReport&, void*);

  explicit SpeedTestClient(const Settings& settings) noexcept
      : settings_(settings),
        listen_port_(settings.broadcast_port),
        running_(false),
        sink_(&LogSessionEvent),
        sink_ctx_(nullptr),
        on_report_(nullptr),
        report_ctx_(nullptr),
        completed_(0) {}

  ~SpeedTestClient() { Stop(); }

  SpeedTestClient(const SpeedTestClient&) = delete;
  SpeedTestClient& operator=(const SpeedTestClient&) = delete;

  /** @brief Override the broadcast port to listen on (0 = ephemeral). */
  void SetListenPort(uint16_t port) noexcept { listen_port_ = port; }

  void SetEventSink(SessionEventFn fn, void* ctx = nullptr) noexcept {
    sink_ = fn;
    sink_ctx_ = ctx;
  }

  /** @brief Called on the session thread with each finished report. */
  void SetOnReport(ReportFn fn, void* ctx = nullptr) noexcept {
    on_report_ = fn;
    report_ctx_ = ctx;
  }

  expected<void, DiscoveryError> Start() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kAlreadyRunning);
    }
    OfferListener::Config cfg;
    cfg.wire = settings_.wire;
    cfg.broadcast_port = listen_port_;
    listener_ = std::make_unique<OfferListener>(cfg);
    listener_->SetOnOffer(&SpeedTestClient::OnOffer, this);

    running_.store(true, std::memory_order_release);
    auto r = listener_->Start();
    if (!r.has_value()) {
      running_.store(false, std::memory_order_release);
      NSPEED_LOG_ERROR("CLIENT", "cannot listen on port %u: %s",
                       static_cast<unsigned>(listen_port_),
                       DiscoveryErrorName(r.get_error()));
      return r;
    }
    NSPEED_LOG_INFO("CLIENT",
                    "Client started, listening for offer requests on port %u...",
                    static_cast<unsigned>(listener_->LocalPort()));
    return expected<void, DiscoveryError>::success();
  }

  /**
   * @brief Stop listening, then wait for running sessions.
   *
   * Sessions are not interrupted; they finish or time out on their own.
   */
  void Stop() noexcept {
    if (!running_.load(std::memory_order_acquire)) return;
    running_.store(false, std::memory_order_release);
    if (listener_) listener_->Stop();

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& entry : sessions_) {
      if (entry.thread.joinable()) {
        entry.thread.join();
      }
    }
    sessions_.clear();
    NSPEED_LOG_INFO("CLIENT", "Client shutting down.");
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint16_t ListenPort() const noexcept {
    return listener_ ? listener_->LocalPort() : 0U;
  }

  uint64_t SessionsCompleted() const noexcept {
    return completed_.load(std::memory_order_relaxed);
  }

  SessionPlan MakePlan() const noexcept {
    SessionPlan plan;
    plan.wire = settings_.wire;
    plan.file_size = settings_.file_size;
    plan.tcp_connections = settings_.tcp_connections;
    plan.udp_connections = settings_.udp_connections;
    plan.udp_idle_timeout_ms = settings_.UdpIdleTimeoutMs();
    return plan;
  }

 private:
  struct SessionEntry {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  static void OnOffer(const ServerOffer& offer, void* ctx) {
    static_cast<SpeedTestClient*>(ctx)->Dispatch(offer);
  }

  void ReapFinishedSessions() {
    for (uint32_t i = 0; i < sessions_.size();) {
      if (sessions_[i].finished->load(std::memory_order_acquire)) {
        if (sessions_[i].thread.joinable()) {
          sessions_[i].thread.join();
        }
        sessions_[i] = std::move(sessions_.back());
        sessions_.pop_back();
      } else {
        ++i;
      }
    }
  }

  // Listener thread: never runs the test inline.
  void Dispatch(const ServerOffer& offer) {
    if (!running_.load(std::memory_order_acquire)) return;

    if (sink_ != nullptr) {
      SessionEvent e;
      e.kind = SessionEventKind::kOfferReceived;
      e.offer = &offer;
      sink_(e, sink_ctx_);
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    ReapFinishedSessions();
    sessions_.push_back(SessionEntry{
        std::thread([this, offer, finished]() {
          SessionOrchestrator orchestrator(MakePlan());
          orchestrator.SetEventSink(sink_, sink_ctx_);
          SessionReport report = orchestrator.Run(offer);
          completed_.fetch_add(1, std::memory_order_relaxed);
          if (on_report_ != nullptr) {
            on_report_(report, report_ctx_);
          }
          finished->store(true, std::memory_order_release);
        }),
        finished});
  }

  Settings settings_;
  uint16_t listen_port_;
  std::atomic<bool> running_;
  SessionEventFn sink_;
  void* sink_ctx_;
  ReportFn on_report_;
  void* report_ctx_;
  std::atomic<uint64_t> completed_;
  std::unique_ptr<OfferListener> listener_;
  std::vector<SessionEntry> sessions_;
  std::mutex sessions_mutex_;
};

}  // namespace nspeed

#endif  // NSPEED_HAS_NETWORK

#endif  // NSPEED_CLIENT_HPP_
