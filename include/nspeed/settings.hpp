/**
 * @file settings.hpp
 * @brief Resolved protocol, network and transfer settings.
 *
 * Defaults match the wire constants; a config file overrides any subset:
 *
 * @code
 *   [protocol] magic_cookie = 0xabcddcba
 *   [network]  broadcast_port = 13117
 *   [transfer] segment_size = 1024
 *   [client]   file_size = 1000000
 *   [log]      level = info
 * @endcode
 */

#ifndef NSPEED_SETTINGS_HPP_
#define NSPEED_SETTINGS_HPP_

#include "nspeed/config.hpp"
#include "nspeed/log.hpp"
#include "nspeed/stats.hpp"
#include "nspeed/wire_codec.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace nspeed {

constexpr uint16_t kDefaultBroadcastPort = 13117U;
constexpr double kDefaultBroadcastInterval = 1.0;
constexpr double kDefaultUdpIdleTimeout = 1.0;
constexpr uint32_t kDefaultTcpChunkSize = 4096U;
constexpr int32_t kDefaultTcpBacklog = 999;
constexpr uint64_t kDefaultFileSize = 1000000U;

/// Largest segment that still fits one IPv4 UDP datagram (65507) with its header.
constexpr uint32_t kMaxSegmentSize = 65507U - kPayloadHeaderSize;

struct Settings {
  // [protocol]
  WireConstants wire;
  // [network]
  uint16_t broadcast_port = kDefaultBroadcastPort;
  char broadcast_address[64] = "255.255.255.255";
  double broadcast_interval_s = kDefaultBroadcastInterval;
  int32_t max_tcp_connections = kDefaultTcpBacklog;
  // [transfer]
  uint32_t segment_size = kDefaultSegmentSize;
  double udp_idle_timeout_s = kDefaultUdpIdleTimeout;
  uint32_t tcp_chunk_size = kDefaultTcpChunkSize;
  // [client]
  uint64_t file_size = kDefaultFileSize;
  uint32_t tcp_connections = 1U;
  uint32_t udp_connections = 1U;
  // [log]
  log::Level log_level = log::Level::kInfo;

  uint32_t BroadcastIntervalMs() const noexcept {
    return static_cast<uint32_t>(broadcast_interval_s * 1000.0 + 0.5);
  }
  uint32_t UdpIdleTimeoutMs() const noexcept {
    return static_cast<uint32_t>(udp_idle_timeout_s * 1000.0 + 0.5);
  }
};

// ============================================================================
// Validation
// ============================================================================

/// True when @p seconds rounds to a millisecond count in [1, UINT32_MAX].
inline bool IsMillisecondRange(double seconds) noexcept {
  const double ms = seconds * 1000.0 + 0.5;
  return ms >= 1.0 && ms < static_cast<double>(UINT32_MAX);
}

inline expected<void, ConfigError> ValidateSettings(const Settings& s) {
  const char* bad = nullptr;
  if (s.segment_size == 0U || s.segment_size > kMaxSegmentSize) {
    bad = "transfer.segment_size";
  } else if (s.tcp_chunk_size == 0U) {
    bad = "transfer.tcp_chunk_size";
  } else if (!IsMillisecondRange(s.udp_idle_timeout_s)) {
    bad = "transfer.udp_idle_timeout";
  } else if (!IsMillisecondRange(s.broadcast_interval_s)) {
    bad = "network.broadcast_interval";
  } else if (s.broadcast_port == 0U) {
    bad = "network.broadcast_port";
  } else if (s.max_tcp_connections <= 0) {
    bad = "network.max_tcp_connections";
  } else if (s.wire.offer_type == s.wire.request_type ||
             s.wire.offer_type == s.wire.payload_type ||
             s.wire.request_type == s.wire.payload_type) {
    bad = "protocol message types (must be distinct)";
  }
  if (bad != nullptr) {
    NSPEED_LOG_ERROR("CONFIG", "Invalid value for %s", bad);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

// ============================================================================
// Loading
// ============================================================================

namespace detail {

/// Applies strict overlays and logs the first key that does not parse.
class SettingsReader {
 public:
  explicit SettingsReader(const ConfigStore& cfg) noexcept
      : cfg_(cfg), ok_(true) {}

  template <typename T>
  void Read(const char* section, const char* key, T& field) {
    Check(cfg_.Overlay(section, key, field), section, key);
  }

  void ReadHex(const char* section, const char* key, uint64_t max,
               uint64_t& field) {
    Check(cfg_.OverlayHex(section, key, max, field), section, key);
  }

  void ReadPort(const char* section, const char* key, uint16_t& field) {
    Check(cfg_.OverlayPort(section, key, field), section, key);
  }

  bool ok() const noexcept { return ok_; }

 private:
  void Check(const expected<void, ConfigError>& r, const char* section,
             const char* key) {
    if (r.has_value() || !ok_) return;
    ok_ = false;
    NSPEED_LOG_ERROR("CONFIG", "Invalid value for %s.%s: '%s'", section, key,
                     cfg_.GetString(section, key));
  }

  const ConfigStore& cfg_;
  bool ok_;
};

}  // namespace detail

/**
 * @brief Copy every key present in @p cfg over the matching field.
 *
 * Missing keys keep their current values. A value that does not parse as its
 * field's type, a protocol constant wider than its wire field or an unknown
 * log level yields kInvalidValue and leaves @p s partly updated; the result
 * is then validated as a whole.
 */
inline expected<void, ConfigError> ApplySettings(const ConfigStore& cfg,
                                                 Settings& s) {
  detail::SettingsReader in(cfg);

  uint64_t cookie = s.wire.magic_cookie;
  uint64_t offer = s.wire.offer_type;
  uint64_t request = s.wire.request_type;
  uint64_t payload = s.wire.payload_type;
  in.ReadHex("protocol", "magic_cookie", 0xFFFFFFFFULL, cookie);
  in.ReadHex("protocol", "offer_type", 0xFFU, offer);
  in.ReadHex("protocol", "request_type", 0xFFU, request);
  in.ReadHex("protocol", "payload_type", 0xFFU, payload);

  in.ReadPort("network", "broadcast_port", s.broadcast_port);
  in.Read("network", "broadcast_interval", s.broadcast_interval_s);
  in.Read("network", "max_tcp_connections", s.max_tcp_connections);

  in.Read("transfer", "segment_size", s.segment_size);
  in.Read("transfer", "udp_idle_timeout", s.udp_idle_timeout_s);
  in.Read("transfer", "tcp_chunk_size", s.tcp_chunk_size);

  in.Read("client", "file_size", s.file_size);
  in.Read("client", "tcp_connections", s.tcp_connections);
  in.Read("client", "udp_connections", s.udp_connections);

  if (!in.ok()) {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  s.wire.magic_cookie = static_cast<uint32_t>(cookie);
  s.wire.offer_type = static_cast<uint8_t>(offer);
  s.wire.request_type = static_cast<uint8_t>(request);
  s.wire.payload_type = static_cast<uint8_t>(payload);

  if (cfg.HasKey("network", "broadcast_address")) {
    (void)std::snprintf(s.broadcast_address, sizeof(s.broadcast_address), "%s",
                        cfg.GetString("network", "broadcast_address"));
  }

  const char* level = cfg.GetString("log", "level", nullptr);
  if (level != nullptr && !log::ParseLevel(level, s.log_level)) {
    NSPEED_LOG_ERROR("CONFIG", "Unknown log level '%s'", level);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }

  return ValidateSettings(s);
}

/**
 * @brief Load @p path (format from its extension) over @p s.
 *
 * kFileNotFound leaves @p s untouched; callers treat it as "use defaults".
 */
inline expected<void, ConfigError> LoadSettings(const char* path, Settings& s) {
  MultiConfig cfg;
  auto r = cfg.LoadFile(path);
  if (!r.has_value()) {
    if (r.get_error() == ConfigError::kFileNotFound) {
      NSPEED_LOG_WARN("CONFIG", "Cannot load '%s', using defaults", path);
    } else if (cfg.ErrorLine() > 0) {
      NSPEED_LOG_ERROR("CONFIG", "Failed to load '%s': %s at line %d", path,
                       ConfigErrorName(r.get_error()),
                       static_cast<int>(cfg.ErrorLine()));
    } else {
      NSPEED_LOG_ERROR("CONFIG", "Failed to load '%s': %s", path,
                       ConfigErrorName(r.get_error()));
    }
    return r;
  }
  NSPEED_LOG_INFO("CONFIG", "Loaded configuration from '%s'", path);
  return ApplySettings(cfg, s);
}

// ============================================================================
// Command line helpers
// ============================================================================

/// Scan argv for "<name> <value>" and return the value, or nullptr.
inline const char* FindArg(int argc, char* argv[], const char* name) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], name) == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

/**
 * @brief Parse a decimal count, mapping non-positive values to 0.
 * @return false on empty or non-numeric input (surrounding spaces allowed).
 */
inline bool ParseCount(const char* text, uint64_t& out) noexcept {
  if (text == nullptr) return false;
  while (*text == ' ' || *text == '\t') ++text;
  if (*text == '\0') return false;
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(text, &end, 10);
  if (end == text || errno == ERANGE) return false;
  while (*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r') ++end;
  if (*end != '\0') return false;
  out = (v > 0) ? static_cast<uint64_t>(v) : 0U;
  return true;
}

/**
 * @brief Parse an interactive answer. A blank line keeps @p current.
 * @return false on non-numeric input.
 */
inline bool ParseCountOrKeep(const char* text, uint64_t current,
                             uint64_t& out) noexcept {
  if (text == nullptr) return false;
  const char* p = text;
  while (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r') ++p;
  if (*p == '\0') {
    out = current;
    return true;
  }
  return ParseCount(text, out);
}

}  // namespace nspeed

#endif  // NSPEED_SETTINGS_HPP_
