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
 * @file socket.hpp
 * @brief RAII POSIX sockets for the speed-test endpoints.
 *
 * TcpSocket, UdpSocket and TcpListener each own one descriptor through a
 * shared move-only base; SocketAddress wraps sockaddr_in. Blocking calls
 * retry on EINTR, and a receive that hits SO_RCVTIMEO reports kWouldBlock
 * so loops can poll their running flag. Errors are nspeed::expected values.
 */

#ifndef NSPEED_SOCKET_HPP_
#define NSPEED_SOCKET_HPP_

#include "nspeed/platform.hpp"
#include "nspeed/vocabulary.hpp"

#if NSPEED_HAS_NETWORK

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace nspeed {

/// Largest UDP datagram payload over IPv4.
constexpr uint32_t kMaxDatagramSize = 65507U;

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kInvalidAddress,
  kWouldBlock  ///< SO_RCVTIMEO expired (or EAGAIN).
};

inline const char* SocketErrorName(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:      return "invalid fd";
    case SocketError::kBindFailed:     return "bind failed";
    case SocketError::kListenFailed:   return "listen failed";
    case SocketError::kConnectFailed:  return "connect failed";
    case SocketError::kSendFailed:     return "send failed";
    case SocketError::kRecvFailed:     return "recv failed";
    case SocketError::kAcceptFailed:   return "accept failed";
    case SocketError::kSetOptFailed:   return "setsockopt failed";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kWouldBlock:     return "timed out";
    default:                           return "unknown";
  }
}

// ============================================================================
// SocketAddress
// ============================================================================

/** @brief IPv4 address and port. */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /**
   * @brief Parse a dotted-decimal IPv4 string.
   * @return kInvalidAddress for nullptr, host names and malformed input.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa = Any(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /** @brief INADDR_ANY on @p port (0 lets the kernel choose). */
  static SocketAddress Any(uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    sa.addr_.sin_port = htons(port);
    return sa;
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /**
   * @brief Write the dotted-decimal IP into @p buf.
   * @return @p buf, or "?" when it cannot be formatted.
   */
  const char* Ip(char* buf, size_t len) const noexcept {
    if (buf == nullptr || len == 0) return "?";
    if (::inet_ntop(AF_INET, &addr_.sin_addr, buf,
                    static_cast<socklen_t>(len)) == nullptr) {
      buf[0] = '\0';
      return "?";
    }
    return buf;
  }

 private:
  sockaddr_in addr_;
};

namespace detail {

/// Maps a send/recv return value onto a byte count or SocketError.
inline expected<int32_t, SocketError> IoResult(ssize_t n,
                                               SocketError failure) noexcept {
  if (n >= 0) {
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK) {
    return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
  }
  return expected<int32_t, SocketError>::error(failure);
}

/**
 * @brief Move-only owner of one socket descriptor.
 *
 * Holds the operations every socket kind shares: binding, SO_REUSEADDR,
 * receive timeouts and the bound address.
 */
class SocketBase {
 public:
  SocketBase(const SocketBase&) = delete;
  SocketBase& operator=(const SocketBase&) = delete;

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) return Fail(SocketError::kInvalidFd);
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return Fail(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    return SetFlag(SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
  }

  /** @brief Bound every blocking receive to @p timeout_ms (0 = forever). */
  expected<void, SocketError> SetRecvTimeout(uint32_t timeout_ms) noexcept {
    if (fd_ < 0) return Fail(SocketError::kInvalidFd);
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000U) * 1000U);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv,
                     static_cast<socklen_t>(sizeof(tv))) < 0) {
      return Fail(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<SocketAddress, SocketError> LocalAddress() const noexcept {
    SocketAddress local;
    socklen_t len = local.Size();
    if (fd_ < 0 || ::getsockname(fd_, local.RawMut(), &len) != 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidFd);
    }
    return expected<SocketAddress, SocketError>::success(local);
  }

  /** @brief Bound port in host byte order, 0 when unbound or closed. */
  uint16_t LocalPort() const noexcept {
    auto local = LocalAddress();
    return local.has_value() ? local.value().Port() : 0U;
  }

  /** @brief Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 protected:
  explicit SocketBase(int32_t fd = -1) noexcept : fd_(fd) {}
  ~SocketBase() { Close(); }

  SocketBase(SocketBase&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  SocketBase& operator=(SocketBase&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  expected<void, SocketError> SetFlag(int level, int name,
                                      int32_t value) noexcept {
    if (fd_ < 0) return Fail(SocketError::kInvalidFd);
    if (::setsockopt(fd_, level, name, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return Fail(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> ConnectTo(const SocketAddress& addr) noexcept {
    if (fd_ < 0) return Fail(SocketError::kInvalidFd);
    int32_t ret;
    do {
      ret = ::connect(fd_, addr.Raw(), addr.Size());
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) return Fail(SocketError::kConnectFailed);
    return expected<void, SocketError>::success();
  }

  static expected<void, SocketError> Fail(SocketError e) noexcept {
    return expected<void, SocketError>::error(e);
  }

  static int32_t Open(int type) noexcept { return ::socket(AF_INET, type, 0); }

  int32_t fd_;
};

}  // namespace detail

// ============================================================================
// TcpSocket
// ============================================================================

/** @brief Connected TCP stream. One owner, one thread at a time. */
class TcpSocket : public detail::SocketBase {
 public:
  TcpSocket() noexcept = default;
  TcpSocket(TcpSocket&&) noexcept = default;
  TcpSocket& operator=(TcpSocket&&) noexcept = default;

  static expected<TcpSocket, SocketError> Create() noexcept {
    const int32_t fd = Open(SOCK_STREAM);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  expected<void, SocketError> Connect(const SocketAddress& addr) noexcept {
    return ConnectTo(addr);
  }

  /**
   * @brief Send the whole buffer, looping over short writes.
   *
   * MSG_NOSIGNAL: a peer that went away is kSendFailed, never SIGPIPE.
   */
  expected<void, SocketError> SendAll(const void* data, size_t len) noexcept {
    if (fd_ < 0) return Fail(SocketError::kInvalidFd);
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    while (len > 0U) {
      ssize_t n;
      do {
        n = ::send(fd_, ptr, len, MSG_NOSIGNAL);
      } while (n < 0 && errno == EINTR);
      auto r = detail::IoResult(n, SocketError::kSendFailed);
      if (!r.has_value()) return Fail(r.get_error());
      if (r.value() == 0) return Fail(SocketError::kSendFailed);
      ptr += r.value();
      len -= static_cast<size_t>(r.value());
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Receive up to @p len bytes.
   * @return Byte count; 0 means the peer closed the stream.
   */
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::recv(fd_, buf, len, 0);
    } while (n < 0 && errno == EINTR);
    return detail::IoResult(n, SocketError::kRecvFailed);
  }

 private:
  friend class TcpListener;
  explicit TcpSocket(int32_t fd) noexcept : SocketBase(fd) {}
};

// ============================================================================
// UdpSocket
// ============================================================================

/**
 * @brief Datagram socket. SendTo and RecvFrom may run on different threads
 * at the same time.
 */
class UdpSocket : public detail::SocketBase {
 public:
  UdpSocket() noexcept = default;
  UdpSocket(UdpSocket&&) noexcept = default;
  UdpSocket& operator=(UdpSocket&&) noexcept = default;

  static expected<UdpSocket, SocketError> Create() noexcept {
    const int32_t fd = Open(SOCK_DGRAM);
    if (fd < 0) {
      return expected<UdpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<UdpSocket, SocketError>::success(UdpSocket(fd));
  }

  /** @brief Fix the default peer; sends nothing. */
  expected<void, SocketError> Connect(const SocketAddress& addr) noexcept {
    return ConnectTo(addr);
  }

  expected<int32_t, SocketError> SendTo(const void* data, size_t len,
                                        const SocketAddress& dest) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::sendto(fd_, data, len, 0, dest.Raw(), dest.Size());
    } while (n < 0 && errno == EINTR);
    return detail::IoResult(n, SocketError::kSendFailed);
  }

  expected<int32_t, SocketError> RecvFrom(void* buf, size_t len,
                                          SocketAddress& src) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      socklen_t addr_len = src.Size();
      n = ::recvfrom(fd_, buf, len, 0, src.RawMut(), &addr_len);
    } while (n < 0 && errno == EINTR);
    return detail::IoResult(n, SocketError::kRecvFailed);
  }

  /** @brief SO_REUSEPORT where the platform has it; no-op success otherwise. */
  expected<void, SocketError> SetReusePort(bool enable) noexcept {
#ifdef SO_REUSEPORT
    return SetFlag(SOL_SOCKET, SO_REUSEPORT, enable ? 1 : 0);
#else
    (void)enable;
    return expected<void, SocketError>::success();
#endif
  }

  expected<void, SocketError> SetBroadcast(bool enable) noexcept {
    return SetFlag(SOL_SOCKET, SO_BROADCAST, enable ? 1 : 0);
  }

  expected<void, SocketError> SetRecvBufferSize(int32_t bytes) noexcept {
    return SetFlag(SOL_SOCKET, SO_RCVBUF, bytes);
  }

 private:
  explicit UdpSocket(int32_t fd) noexcept : SocketBase(fd) {}
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener : public detail::SocketBase {
 public:
  TcpListener() noexcept = default;
  TcpListener(TcpListener&&) noexcept = default;
  TcpListener& operator=(TcpListener&&) noexcept = default;

  static expected<TcpListener, SocketError> Create() noexcept {
    const int32_t fd = Open(SOCK_STREAM);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
  }

  expected<void, SocketError> Listen(int32_t backlog) noexcept {
    if (fd_ < 0) return Fail(SocketError::kInvalidFd);
    if (::listen(fd_, backlog) < 0) return Fail(SocketError::kListenFailed);
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Accept one connection.
   * @param[out] peer Address of the connecting client.
   */
  expected<TcpSocket, SocketError> Accept(SocketAddress& peer) noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t conn;
    do {
      socklen_t addr_len = peer.Size();
      conn = ::accept(fd_, peer.RawMut(), &addr_len);
    } while (conn < 0 && errno == EINTR);
    if (conn < 0) {
      const bool timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
      return expected<TcpSocket, SocketError>::error(
          timed_out ? SocketError::kWouldBlock : SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(conn));
  }

  /** @brief Bound Accept() to @p timeout_ms so the caller can poll a flag. */
  expected<void, SocketError> SetAcceptTimeout(uint32_t timeout_ms) noexcept {
    return SetRecvTimeout(timeout_ms);
  }

  /** @brief Wake a thread blocked in Accept(); the fd stays owned. */
  void Shutdown() noexcept {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

 private:
  explicit TcpListener(int32_t fd) noexcept : SocketBase(fd) {}
};

// ============================================================================
// LocalIpv4
// ============================================================================

/**
 * @brief Address of the interface holding the default route.
 *
 * Connects an unsent UDP socket to a public address and reads back the
 * local side. Falls back to "127.0.0.1" when there is no route.
 */
inline const char* LocalIpv4(char* buf, size_t len) noexcept {
  static constexpr const char* kFallback = "127.0.0.1";
  const char* found = kFallback;
  char ip[INET_ADDRSTRLEN];

  auto probe = UdpSocket::Create();
  auto target = SocketAddress::FromIpv4("8.8.8.8", 80);
  if (probe.has_value() && target.has_value() &&
      probe.value().Connect(target.value()).has_value()) {
    auto local = probe.value().LocalAddress();
    if (local.has_value() &&
        std::strcmp(local.value().Ip(ip, sizeof(ip)), "?") != 0) {
      found = ip;
    }
  }
  (void)std::snprintf(buf, len, "%s", found);
  return buf;
}

}  // namespace nspeed

#endif  // NSPEED_HAS_NETWORK

#endif  // NSPEED_SOCKET_HPP_
