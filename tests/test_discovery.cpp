/**
 * @file test_discovery.cpp
 * @brief Tests for discovery.hpp: OfferBroadcaster and OfferListener on loopback.
 */

#include <catch2/catch_test_macros.hpp>
#include "nspeed/discovery.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

namespace {

struct OfferSink {
  std::atomic<uint32_t> count{0};
  std::mutex mutex;
  nspeed::ServerOffer last;

  static void OnOffer(const nspeed::ServerOffer& offer, void* ctx) {
    auto* self = static_cast<OfferSink*>(ctx);
    {
      std::lock_guard<std::mutex> lock(self->mutex);
      self->last = offer;
    }
    self->count.fetch_add(1, std::memory_order_relaxed);
  }
};

template <typename Pred>
bool WaitFor(Pred pred, uint32_t timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

nspeed::OfferListener::Config EphemeralListener() {
  nspeed::OfferListener::Config cfg;
  cfg.broadcast_port = 0;
  cfg.poll_timeout_ms = 50;
  return cfg;
}

void SendRaw(uint16_t port, const void* data, size_t len) {
  auto s = nspeed::UdpSocket::Create();
  REQUIRE(s.has_value());
  auto dest = nspeed::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(dest.has_value());
  REQUIRE(s.value().SendTo(data, len, dest.value()).has_value());
}

}  // namespace

// ============================================================================
// 1. OfferListener
// ============================================================================

TEST_CASE("discovery - listener binds an ephemeral port", "[discovery][listener]") {
  nspeed::OfferListener listener(EphemeralListener());
  REQUIRE(listener.Start().has_value());
  REQUIRE(listener.IsRunning());
  REQUIRE(listener.LocalPort() != 0);

  auto again = listener.Start();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == nspeed::DiscoveryError::kAlreadyRunning);

  listener.Stop();
  REQUIRE_FALSE(listener.IsRunning());
}

TEST_CASE("discovery - listener reports a valid Offer with its sender", "[discovery][listener]") {
  OfferSink sink;
  nspeed::OfferListener listener(EphemeralListener());
  listener.SetOnOffer(&OfferSink::OnOffer, &sink);
  REQUIRE(listener.Start().has_value());

  nspeed::OfferMessage msg;
  msg.udp_port = 40001;
  msg.tcp_port = 40002;
  uint8_t buf[nspeed::kOfferSize];
  REQUIRE(nspeed::EncodeOffer(msg, buf, sizeof(buf)).has_value());
  SendRaw(listener.LocalPort(), buf, sizeof(buf));

  REQUIRE(WaitFor([&]() { return sink.count.load() >= 1U; }, 2000));
  listener.Stop();

  std::lock_guard<std::mutex> lock(sink.mutex);
  REQUIRE(std::strcmp(sink.last.address, "127.0.0.1") == 0);
  REQUIRE(sink.last.udp_port == 40001);
  REQUIRE(sink.last.tcp_port == 40002);
  REQUIRE(listener.OffersReceived() == 1U);
}

TEST_CASE("discovery - listener drops foreign and malformed datagrams", "[discovery][listener]") {
  OfferSink sink;
  nspeed::OfferListener listener(EphemeralListener());
  listener.SetOnOffer(&OfferSink::OnOffer, &sink);
  REQUIRE(listener.Start().has_value());

  const char garbage[] = "hello world";
  SendRaw(listener.LocalPort(), garbage, sizeof(garbage));

  uint8_t request[nspeed::kRequestSize];
  REQUIRE(nspeed::EncodeRequest(nspeed::RequestMessage{}, request,
                                sizeof(request)).has_value());
  SendRaw(listener.LocalPort(), request, sizeof(request));

  uint8_t short_offer[nspeed::kOfferSize];
  REQUIRE(nspeed::EncodeOffer(nspeed::OfferMessage{}, short_offer,
                              sizeof(short_offer)).has_value());
  SendRaw(listener.LocalPort(), short_offer, 6);

  REQUIRE(WaitFor([&]() { return listener.DroppedCount() >= 3U; }, 2000));
  listener.Stop();
  REQUIRE(sink.count.load() == 0U);
}

TEST_CASE("discovery - listener honours custom wire constants", "[discovery][listener]") {
  OfferSink sink;
  nspeed::OfferListener::Config cfg = EphemeralListener();
  cfg.wire.magic_cookie = 0x11223344U;
  nspeed::OfferListener listener(cfg);
  listener.SetOnOffer(&OfferSink::OnOffer, &sink);
  REQUIRE(listener.Start().has_value());

  uint8_t buf[nspeed::kOfferSize];
  REQUIRE(nspeed::EncodeOffer(nspeed::OfferMessage{}, buf, sizeof(buf)).has_value());
  SendRaw(listener.LocalPort(), buf, sizeof(buf));
  REQUIRE(WaitFor([&]() { return listener.DroppedCount() >= 1U; }, 2000));

  REQUIRE(nspeed::EncodeOffer(nspeed::OfferMessage{}, buf, sizeof(buf),
                              cfg.wire).has_value());
  SendRaw(listener.LocalPort(), buf, sizeof(buf));
  REQUIRE(WaitFor([&]() { return sink.count.load() >= 1U; }, 2000));
  listener.Stop();
}

// ============================================================================
// 2. OfferBroadcaster
// ============================================================================

TEST_CASE("discovery - broadcaster announces to a listener", "[discovery][broadcast]") {
  OfferSink sink;
  nspeed::OfferListener listener(EphemeralListener());
  listener.SetOnOffer(&OfferSink::OnOffer, &sink);
  REQUIRE(listener.Start().has_value());

  nspeed::OfferBroadcaster::Config bc;
  bc.udp_port = 5001;
  bc.tcp_port = 5002;
  bc.broadcast_address = "127.0.0.1";
  bc.broadcast_port = listener.LocalPort();
  bc.interval_ms = 20;
  nspeed::OfferBroadcaster broadcaster(bc);
  REQUIRE(broadcaster.Start().has_value());

  REQUIRE(WaitFor([&]() { return sink.count.load() >= 3U; }, 3000));
  broadcaster.Stop();
  listener.Stop();

  REQUIRE(broadcaster.OffersSent() >= 3U);
  std::lock_guard<std::mutex> lock(sink.mutex);
  REQUIRE(sink.last.udp_port == 5001);
  REQUIRE(sink.last.tcp_port == 5002);
}

TEST_CASE("discovery - broadcaster Stop does not wait out the interval", "[discovery][broadcast]") {
  nspeed::OfferBroadcaster::Config bc;
  bc.broadcast_address = "127.0.0.1";
  bc.broadcast_port = 9;  // discard
  bc.interval_ms = 60000;
  nspeed::OfferBroadcaster broadcaster(bc);
  REQUIRE(broadcaster.Start().has_value());
  REQUIRE(WaitFor([&]() { return broadcaster.OffersSent() >= 1U; }, 2000));

  auto t0 = std::chrono::steady_clock::now();
  broadcaster.Stop();
  auto waited = std::chrono::steady_clock::now() - t0;
  REQUIRE(waited < std::chrono::seconds(5));
  REQUIRE_FALSE(broadcaster.IsRunning());
}

TEST_CASE("discovery - broadcaster rejects a bad address", "[discovery][broadcast]") {
  nspeed::OfferBroadcaster::Config bc;
  bc.broadcast_address = "not-an-address";
  nspeed::OfferBroadcaster broadcaster(bc);
  auto r = broadcaster.Start();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == nspeed::DiscoveryError::kInvalidAddress);
  REQUIRE_FALSE(broadcaster.IsRunning());
}
