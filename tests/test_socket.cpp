/**
 * @file test_socket.cpp
 * @brief Tests for socket.hpp: SocketAddress, TcpSocket, UdpSocket, TcpListener.
 */

#include <catch2/catch_test_macros.hpp>
#include "nspeed/socket.hpp"

#include <cstring>
#include <thread>

// ============================================================================
// Create
// ============================================================================

TEST_CASE("socket - TcpSocket::Create succeeds", "[socket][tcp]") {
  auto result = nspeed::TcpSocket::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
  REQUIRE(result.value().Fd() >= 0);
}

TEST_CASE("socket - UdpSocket::Create succeeds", "[socket][udp]") {
  auto result = nspeed::UdpSocket::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
}

TEST_CASE("socket - TcpListener::Create succeeds", "[socket][tcp]") {
  auto result = nspeed::TcpListener::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
}

// ============================================================================
// SocketAddress
// ============================================================================

TEST_CASE("socket - SocketAddress::FromIpv4 valid", "[socket][address]") {
  auto result = nspeed::SocketAddress::FromIpv4("127.0.0.1", 8080);
  REQUIRE(result.has_value());
  REQUIRE(result.value().Size() == sizeof(sockaddr_in));
  REQUIRE(result.value().Port() == 8080);

  char ip[INET_ADDRSTRLEN];
  REQUIRE(std::strcmp(result.value().Ip(ip, sizeof(ip)), "127.0.0.1") == 0);
}

TEST_CASE("socket - SocketAddress::FromIpv4 invalid returns error",
          "[socket][address]") {
  auto result = nspeed::SocketAddress::FromIpv4("not.an.ip.address", 80);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == nspeed::SocketError::kInvalidAddress);

  REQUIRE(!nspeed::SocketAddress::FromIpv4(nullptr, 80).has_value());
}

TEST_CASE("socket - SocketAddress::Any is the wildcard address", "[socket][address]") {
  nspeed::SocketAddress any = nspeed::SocketAddress::Any(13117);
  REQUIRE(any.Port() == 13117);
  char ip[INET_ADDRSTRLEN];
  REQUIRE(std::strcmp(any.Ip(ip, sizeof(ip)), "0.0.0.0") == 0);
}

// ============================================================================
// Ownership
// ============================================================================

TEST_CASE("socket - TcpSocket move semantics", "[socket][tcp]") {
  auto result = nspeed::TcpSocket::Create();
  REQUIRE(result.has_value());

  nspeed::TcpSocket a = std::move(result.value());
  int original_fd = a.Fd();

  nspeed::TcpSocket b(std::move(a));
  REQUIRE(!a.IsValid());
  REQUIRE(b.Fd() == original_fd);

  nspeed::TcpSocket c;
  c = std::move(b);
  REQUIRE(!b.IsValid());
  REQUIRE(c.Fd() == original_fd);
}

TEST_CASE("socket - Close is idempotent", "[socket][udp]") {
  auto result = nspeed::UdpSocket::Create();
  REQUIRE(result.has_value());
  nspeed::UdpSocket sock = std::move(result.value());

  sock.Close();
  REQUIRE(!sock.IsValid());
  sock.Close();
  REQUIRE(!sock.IsValid());
}

TEST_CASE("socket - options on a closed socket fail", "[socket][udp]") {
  nspeed::UdpSocket sock;
  REQUIRE(!sock.SetBroadcast(true).has_value());
  REQUIRE(!sock.SetRecvTimeout(10).has_value());
  REQUIRE(sock.LocalPort() == 0);
}

TEST_CASE("socket - UdpSocket Connect fixes the local address", "[socket][udp]") {
  auto r = nspeed::UdpSocket::Create();
  REQUIRE(r.has_value());
  nspeed::UdpSocket sock = std::move(r.value());
  auto peer = nspeed::SocketAddress::FromIpv4("127.0.0.1", 9);
  REQUIRE(peer.has_value());
  REQUIRE(sock.Connect(peer.value()).has_value());

  auto local = sock.LocalAddress();
  REQUIRE(local.has_value());
  REQUIRE(local.value().Port() != 0);
  char ip[INET_ADDRSTRLEN];
  REQUIRE(std::strcmp(local.value().Ip(ip, sizeof(ip)), "127.0.0.1") == 0);
}

TEST_CASE("socket - LocalAddress of a closed socket fails", "[socket][tcp]") {
  nspeed::TcpListener listener;
  REQUIRE(!listener.LocalAddress().has_value());
  REQUIRE(listener.LocalPort() == 0);
}

// ============================================================================
// Loopback traffic
// ============================================================================

TEST_CASE("socket - TcpListener bind listen accept loopback",
          "[socket][tcp][integration]") {
  auto listener_r = nspeed::TcpListener::Create();
  REQUIRE(listener_r.has_value());
  nspeed::TcpListener listener = std::move(listener_r.value());
  REQUIRE(listener.SetReuseAddr(true).has_value());

  auto addr_r = nspeed::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(addr_r.has_value());
  REQUIRE(listener.Bind(addr_r.value()).has_value());
  const uint16_t port = listener.LocalPort();
  REQUIRE(port > 0);
  REQUIRE(listener.Listen(4).has_value());

  const char* msg = "1000000\n";
  std::thread client_thread([port, msg]() {
    auto client_r = nspeed::TcpSocket::Create();
    if (!client_r.has_value()) return;
    nspeed::TcpSocket client = std::move(client_r.value());
    auto server_addr = nspeed::SocketAddress::FromIpv4("127.0.0.1", port);
    if (!server_addr.has_value()) return;
    if (!client.Connect(server_addr.value()).has_value()) return;
    (void)client.SendAll(msg, std::strlen(msg));
    client.Close();
  });

  nspeed::SocketAddress client_addr;
  auto accept_r = listener.Accept(client_addr);
  REQUIRE(accept_r.has_value());
  nspeed::TcpSocket accepted = std::move(accept_r.value());
  REQUIRE(accepted.IsValid());

  char buf[64]{};
  size_t got = 0;
  for (;;) {
    auto recv_r = accepted.Recv(buf + got, sizeof(buf) - 1 - got);
    REQUIRE(recv_r.has_value());
    if (recv_r.value() == 0) break;
    got += static_cast<size_t>(recv_r.value());
  }
  REQUIRE(got == std::strlen(msg));
  REQUIRE(std::strcmp(buf, msg) == 0);

  client_thread.join();
}

TEST_CASE("socket - Accept times out with kWouldBlock", "[socket][tcp]") {
  auto listener_r = nspeed::TcpListener::Create();
  REQUIRE(listener_r.has_value());
  nspeed::TcpListener listener = std::move(listener_r.value());
  REQUIRE(listener.Bind(nspeed::SocketAddress::Any(0)).has_value());
  REQUIRE(listener.Listen(1).has_value());
  REQUIRE(listener.SetAcceptTimeout(50).has_value());

  nspeed::SocketAddress peer;
  auto r = listener.Accept(peer);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == nspeed::SocketError::kWouldBlock);
}

TEST_CASE("socket - UdpSocket SendTo RecvFrom loopback",
          "[socket][udp][integration]") {
  auto recv_r = nspeed::UdpSocket::Create();
  REQUIRE(recv_r.has_value());
  nspeed::UdpSocket receiver = std::move(recv_r.value());
  auto bind_addr = nspeed::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(bind_addr.has_value());
  REQUIRE(receiver.Bind(bind_addr.value()).has_value());
  const uint16_t port = receiver.LocalPort();
  REQUIRE(port > 0);

  auto send_r = nspeed::UdpSocket::Create();
  REQUIRE(send_r.has_value());
  nspeed::UdpSocket sender = std::move(send_r.value());

  auto dest = nspeed::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(dest.has_value());
  const char* payload = "udp_test";
  auto sent = sender.SendTo(payload, std::strlen(payload), dest.value());
  REQUIRE(sent.has_value());
  REQUIRE(sent.value() == static_cast<int32_t>(std::strlen(payload)));

  char buf[64]{};
  nspeed::SocketAddress src;
  auto got = receiver.RecvFrom(buf, sizeof(buf), src);
  REQUIRE(got.has_value());
  REQUIRE(got.value() == static_cast<int32_t>(std::strlen(payload)));
  REQUIRE(std::strncmp(buf, payload, std::strlen(payload)) == 0);
  REQUIRE(src.Port() == sender.LocalPort());
}

TEST_CASE("socket - UdpSocket RecvFrom times out", "[socket][udp]") {
  auto r = nspeed::UdpSocket::Create();
  REQUIRE(r.has_value());
  nspeed::UdpSocket sock = std::move(r.value());
  REQUIRE(sock.Bind(nspeed::SocketAddress::Any(0)).has_value());
  REQUIRE(sock.SetRecvTimeout(50).has_value());

  char buf[16];
  nspeed::SocketAddress src;
  auto got = sock.RecvFrom(buf, sizeof(buf), src);
  REQUIRE(!got.has_value());
  REQUIRE(got.get_error() == nspeed::SocketError::kWouldBlock);
}

TEST_CASE("socket - broadcast and buffer options", "[socket][udp]") {
  auto r = nspeed::UdpSocket::Create();
  REQUIRE(r.has_value());
  nspeed::UdpSocket sock = std::move(r.value());
  REQUIRE(sock.SetBroadcast(true).has_value());
  REQUIRE(sock.SetReuseAddr(true).has_value());
  REQUIRE(sock.SetReusePort(true).has_value());
  REQUIRE(sock.SetRecvBufferSize(1 << 20).has_value());
}

TEST_CASE("socket - LocalIpv4 yields a dotted quad", "[socket][address]") {
  char ip[INET_ADDRSTRLEN];
  const char* s = nspeed::LocalIpv4(ip, sizeof(ip));
  REQUIRE(s != nullptr);
  REQUIRE(nspeed::SocketAddress::FromIpv4(s, 0).has_value());
}
