/**
 * @file wire_codec.hpp
 * @brief Binary codec for the Offer / Request / Payload datagrams.
 *
 * Layout (big-endian, no padding):
 *
 *   Offer   : cookie(4) type(1) udp_port(2) tcp_port(2)            =  9 bytes
 *   Request : cookie(4) type(1) file_size(8)                       = 13 bytes
 *   Payload : cookie(4) type(1) total_segments(8) segment_index(8)
 *             payload(N)                                           = 21 + N
 *
 * Cookie and type are checked before any other field is read. Payload length
 * is not encoded; it is whatever follows the 21-byte header.
 */

#ifndef NSPEED_WIRE_CODEC_HPP_
#define NSPEED_WIRE_CODEC_HPP_

#include "nspeed/platform.hpp"
#include "nspeed/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <variant>

namespace nspeed {

// ============================================================================
// Constants
// ============================================================================

constexpr uint32_t kDefaultMagicCookie = 0xABCDDCBAU;
constexpr uint8_t kDefaultOfferType = 0x2U;
constexpr uint8_t kDefaultRequestType = 0x3U;
constexpr uint8_t kDefaultPayloadType = 0x4U;

constexpr uint32_t kOfferSize = 9U;
constexpr uint32_t kRequestSize = 13U;
constexpr uint32_t kPayloadHeaderSize = 21U;

/// Cookie and type values every encode/decode is checked against.
struct WireConstants {
  uint32_t magic_cookie = kDefaultMagicCookie;
  uint8_t offer_type = kDefaultOfferType;
  uint8_t request_type = kDefaultRequestType;
  uint8_t payload_type = kDefaultPayloadType;
};

// ============================================================================
// WireError
// ============================================================================

enum class WireError : uint8_t {
  kTooShort = 0,    ///< Buffer shorter than the fixed header.
  kBadCookie,       ///< Foreign traffic.
  kBadType,         ///< Unknown or unexpected message type.
  kBufferTooSmall,  ///< Encode target cannot hold the message.
};

inline const char* WireErrorName(WireError e) noexcept {
  switch (e) {
    case WireError::kTooShort:       return "too short";
    case WireError::kBadCookie:      return "bad cookie";
    case WireError::kBadType:        return "bad type";
    case WireError::kBufferTooSmall: return "buffer too small";
    default:                         return "unknown";
  }
}

// ============================================================================
// Messages
// ============================================================================

enum class MessageKind : uint8_t { kOffer = 0, kRequest, kPayload };

struct OfferMessage {
  uint16_t udp_port = 0;
  uint16_t tcp_port = 0;
};

struct RequestMessage {
  uint64_t file_size = 0;
};

/// Decoded payload. @c data points into the buffer passed to decode.
struct PayloadMessage {
  uint64_t total_segments = 0;
  uint64_t segment_index = 0;
  const uint8_t* data = nullptr;
  uint32_t data_len = 0;
};

using Message = std::variant<OfferMessage, RequestMessage, PayloadMessage>;

// ============================================================================
// Byte-order helpers (big-endian)
// ============================================================================

namespace detail {

inline void WriteBE16(uint8_t* p, uint16_t v) noexcept {
  p[0] = static_cast<uint8_t>((v >> 8) & 0xFFU);
  p[1] = static_cast<uint8_t>(v & 0xFFU);
}

inline void WriteBE32(uint8_t* p, uint32_t v) noexcept {
  for (int i = 3; i >= 0; --i) {
    p[i] = static_cast<uint8_t>(v & 0xFFU);
    v >>= 8;
  }
}

inline void WriteBE64(uint8_t* p, uint64_t v) noexcept {
  for (int i = 7; i >= 0; --i) {
    p[i] = static_cast<uint8_t>(v & 0xFFU);
    v >>= 8;
  }
}

inline uint16_t ReadBE16(const uint8_t* p) noexcept {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) |
                               static_cast<uint16_t>(p[1]));
}

inline uint32_t ReadBE32(const uint8_t* p) noexcept {
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v = (v << 8) | static_cast<uint32_t>(p[i]);
  }
  return v;
}

inline uint64_t ReadBE64(const uint8_t* p) noexcept {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | static_cast<uint64_t>(p[i]);
  }
  return v;
}

inline void WriteHeader(uint8_t* p, const WireConstants& wc,
                        uint8_t type) noexcept {
  WriteBE32(p, wc.magic_cookie);
  p[4] = type;
}

/// Shared prefix check: length, then cookie, then type.
inline expected<void, WireError> CheckHeader(const uint8_t* buf, uint32_t len,
                                             uint32_t need,
                                             const WireConstants& wc,
                                             uint8_t type) noexcept {
  if (buf == nullptr || len < need) {
    return expected<void, WireError>::error(WireError::kTooShort);
  }
  if (ReadBE32(buf) != wc.magic_cookie) {
    return expected<void, WireError>::error(WireError::kBadCookie);
  }
  if (buf[4] != type) {
    return expected<void, WireError>::error(WireError::kBadType);
  }
  return expected<void, WireError>::success();
}

}  // namespace detail

// ============================================================================
// Encode
// ============================================================================

inline expected<uint32_t, WireError> EncodeOffer(
    const OfferMessage& msg, uint8_t* buf, uint32_t cap,
    const WireConstants& wc = {}) noexcept {
  if (buf == nullptr || cap < kOfferSize) {
    return expected<uint32_t, WireError>::error(WireError::kBufferTooSmall);
  }
  detail::WriteHeader(buf, wc, wc.offer_type);
  detail::WriteBE16(buf + 5, msg.udp_port);
  detail::WriteBE16(buf + 7, msg.tcp_port);
  return expected<uint32_t, WireError>::success(kOfferSize);
}

inline expected<uint32_t, WireError> EncodeRequest(
    const RequestMessage& msg, uint8_t* buf, uint32_t cap,
    const WireConstants& wc = {}) noexcept {
  if (buf == nullptr || cap < kRequestSize) {
    return expected<uint32_t, WireError>::error(WireError::kBufferTooSmall);
  }
  detail::WriteHeader(buf, wc, wc.request_type);
  detail::WriteBE64(buf + 5, msg.file_size);
  return expected<uint32_t, WireError>::success(kRequestSize);
}

/**
 * @brief Write only the 21-byte payload header.
 *
 * The sender fills the body in place right after the header, which avoids
 * a copy per segment.
 */
inline expected<uint32_t, WireError> EncodePayloadHeader(
    uint64_t total_segments, uint64_t segment_index, uint8_t* buf,
    uint32_t cap, const WireConstants& wc = {}) noexcept {
  if (buf == nullptr || cap < kPayloadHeaderSize) {
    return expected<uint32_t, WireError>::error(WireError::kBufferTooSmall);
  }
  detail::WriteHeader(buf, wc, wc.payload_type);
  detail::WriteBE64(buf + 5, total_segments);
  detail::WriteBE64(buf + 13, segment_index);
  return expected<uint32_t, WireError>::success(kPayloadHeaderSize);
}

inline expected<uint32_t, WireError> EncodePayload(
    const PayloadMessage& msg, uint8_t* buf, uint32_t cap,
    const WireConstants& wc = {}) noexcept {
  if (cap < kPayloadHeaderSize ||
      msg.data_len > cap - kPayloadHeaderSize) {
    return expected<uint32_t, WireError>::error(WireError::kBufferTooSmall);
  }
  auto hdr = EncodePayloadHeader(msg.total_segments, msg.segment_index, buf,
                                 cap, wc);
  if (!hdr.has_value()) {
    return hdr;
  }
  if (msg.data_len > 0U && msg.data != nullptr) {
    std::memcpy(buf + kPayloadHeaderSize, msg.data, msg.data_len);
  }
  return expected<uint32_t, WireError>::success(kPayloadHeaderSize +
                                                msg.data_len);
}

/** @brief Encode any message kind into @p buf. */
inline expected<uint32_t, WireError> Encode(
    const Message& msg, uint8_t* buf, uint32_t cap,
    const WireConstants& wc = {}) noexcept {
  if (const auto* o = std::get_if<OfferMessage>(&msg)) {
    return EncodeOffer(*o, buf, cap, wc);
  }
  if (const auto* r = std::get_if<RequestMessage>(&msg)) {
    return EncodeRequest(*r, buf, cap, wc);
  }
  return EncodePayload(*std::get_if<PayloadMessage>(&msg), buf, cap, wc);
}

// ============================================================================
// Decode
// ============================================================================

// Fixed-size messages ignore bytes past their header.

inline expected<OfferMessage, WireError> DecodeOffer(
    const uint8_t* buf, uint32_t len, const WireConstants& wc = {}) noexcept {
  auto chk = detail::CheckHeader(buf, len, kOfferSize, wc, wc.offer_type);
  if (!chk.has_value()) {
    return expected<OfferMessage, WireError>::error(chk.get_error());
  }
  OfferMessage msg;
  msg.udp_port = detail::ReadBE16(buf + 5);
  msg.tcp_port = detail::ReadBE16(buf + 7);
  return expected<OfferMessage, WireError>::success(msg);
}

inline expected<RequestMessage, WireError> DecodeRequest(
    const uint8_t* buf, uint32_t len, const WireConstants& wc = {}) noexcept {
  auto chk = detail::CheckHeader(buf, len, kRequestSize, wc, wc.request_type);
  if (!chk.has_value()) {
    return expected<RequestMessage, WireError>::error(chk.get_error());
  }
  RequestMessage msg;
  msg.file_size = detail::ReadBE64(buf + 5);
  return expected<RequestMessage, WireError>::success(msg);
}

inline expected<PayloadMessage, WireError> DecodePayload(
    const uint8_t* buf, uint32_t len, const WireConstants& wc = {}) noexcept {
  auto chk = detail::CheckHeader(buf, len, kPayloadHeaderSize, wc,
                                 wc.payload_type);
  if (!chk.has_value()) {
    return expected<PayloadMessage, WireError>::error(chk.get_error());
  }
  PayloadMessage msg;
  msg.total_segments = detail::ReadBE64(buf + 5);
  msg.segment_index = detail::ReadBE64(buf + 13);
  msg.data = buf + kPayloadHeaderSize;
  msg.data_len = len - kPayloadHeaderSize;
  return expected<PayloadMessage, WireError>::success(msg);
}

/**
 * @brief Classify a datagram by its type byte after checking the cookie.
 * @return kTooShort below 5 bytes, kBadCookie, or kBadType for unknown types.
 */
inline expected<MessageKind, WireError> PeekType(
    const uint8_t* buf, uint32_t len, const WireConstants& wc = {}) noexcept {
  if (buf == nullptr || len < 5U) {
    return expected<MessageKind, WireError>::error(WireError::kTooShort);
  }
  if (detail::ReadBE32(buf) != wc.magic_cookie) {
    return expected<MessageKind, WireError>::error(WireError::kBadCookie);
  }
  const uint8_t type = buf[4];
  if (type == wc.offer_type) {
    return expected<MessageKind, WireError>::success(MessageKind::kOffer);
  }
  if (type == wc.request_type) {
    return expected<MessageKind, WireError>::success(MessageKind::kRequest);
  }
  if (type == wc.payload_type) {
    return expected<MessageKind, WireError>::success(MessageKind::kPayload);
  }
  return expected<MessageKind, WireError>::error(WireError::kBadType);
}

/** @brief Decode whichever message kind the type byte names. */
inline expected<Message, WireError> Decode(
    const uint8_t* buf, uint32_t len, const WireConstants& wc = {}) noexcept {
  auto kind = PeekType(buf, len, wc);
  if (!kind.has_value()) {
    return expected<Message, WireError>::error(kind.get_error());
  }
  switch (kind.value()) {
    case MessageKind::kOffer: {
      auto r = DecodeOffer(buf, len, wc);
      if (!r.has_value()) return expected<Message, WireError>::error(r.get_error());
      return expected<Message, WireError>::success(Message(r.value()));
    }
    case MessageKind::kRequest: {
      auto r = DecodeRequest(buf, len, wc);
      if (!r.has_value()) return expected<Message, WireError>::error(r.get_error());
      return expected<Message, WireError>::success(Message(r.value()));
    }
    default: {
      auto r = DecodePayload(buf, len, wc);
      if (!r.has_value()) return expected<Message, WireError>::error(r.get_error());
      return expected<Message, WireError>::success(Message(r.value()));
    }
  }
}

}  // namespace nspeed

#endif  // NSPEED_WIRE_CODEC_HPP_
