/**
 * @file test_settings.cpp
 * @brief Tests for settings.hpp: defaults, validation, loading and argv helpers.
 */

#include <catch2/catch_test_macros.hpp>
#include "nspeed/settings.hpp"

#include <cstdio>
#include <cstring>

// ============================================================================
// 1. Defaults
// ============================================================================

TEST_CASE("settings - defaults", "[settings]") {
  nspeed::Settings s;
  REQUIRE(s.wire.magic_cookie == 0xABCDDCBAU);
  REQUIRE(s.wire.offer_type == 0x2);
  REQUIRE(s.wire.request_type == 0x3);
  REQUIRE(s.wire.payload_type == 0x4);
  REQUIRE(s.broadcast_port == 13117);
  REQUIRE(std::strcmp(s.broadcast_address, "255.255.255.255") == 0);
  REQUIRE(s.BroadcastIntervalMs() == 1000U);
  REQUIRE(s.max_tcp_connections == 999);
  REQUIRE(s.segment_size == 1024U);
  REQUIRE(s.UdpIdleTimeoutMs() == 1000U);
  REQUIRE(s.tcp_chunk_size == 4096U);
  REQUIRE(s.file_size == 1000000U);
  REQUIRE(s.tcp_connections == 1U);
  REQUIRE(s.udp_connections == 1U);
  REQUIRE(s.log_level == nspeed::log::Level::kInfo);
  REQUIRE(nspeed::ValidateSettings(s).has_value());
}

TEST_CASE("settings - fractional seconds round to milliseconds", "[settings]") {
  nspeed::Settings s;
  s.broadcast_interval_s = 0.25;
  s.udp_idle_timeout_s = 0.0015;
  REQUIRE(s.BroadcastIntervalMs() == 250U);
  REQUIRE(s.UdpIdleTimeoutMs() == 2U);
}

// ============================================================================
// 2. Validation
// ============================================================================

TEST_CASE("settings - segment size limits", "[settings][validate]") {
  nspeed::Settings s;
  s.segment_size = 0;
  REQUIRE(nspeed::ValidateSettings(s).get_error() ==
          nspeed::ConfigError::kInvalidValue);
  s.segment_size = nspeed::kMaxSegmentSize;
  REQUIRE(nspeed::ValidateSettings(s).has_value());
  s.segment_size = nspeed::kMaxSegmentSize + 1U;
  REQUIRE(!nspeed::ValidateSettings(s).has_value());
}

TEST_CASE("settings - non-positive timings are rejected", "[settings][validate]") {
  nspeed::Settings s;
  s.udp_idle_timeout_s = 0.0;
  REQUIRE(!nspeed::ValidateSettings(s).has_value());

  nspeed::Settings t;
  t.broadcast_interval_s = -1.0;
  REQUIRE(!nspeed::ValidateSettings(t).has_value());
}

TEST_CASE("settings - timings must fit in whole milliseconds", "[settings][validate]") {
  nspeed::Settings s;
  s.udp_idle_timeout_s = 0.0004;
  REQUIRE(nspeed::ValidateSettings(s).get_error() ==
          nspeed::ConfigError::kInvalidValue);
  s.udp_idle_timeout_s = 0.001;
  REQUIRE(nspeed::ValidateSettings(s).has_value());
  REQUIRE(s.UdpIdleTimeoutMs() == 1U);
  s.udp_idle_timeout_s = 1e10;
  REQUIRE(!nspeed::ValidateSettings(s).has_value());

  nspeed::Settings t;
  t.broadcast_interval_s = 1e-7;
  REQUIRE(!nspeed::ValidateSettings(t).has_value());
  t.broadcast_interval_s = 5e6;
  REQUIRE(!nspeed::ValidateSettings(t).has_value());
  t.broadcast_interval_s = 4e6;
  REQUIRE(nspeed::ValidateSettings(t).has_value());
  REQUIRE(t.BroadcastIntervalMs() == 4000000000U);
}

TEST_CASE("settings - message types must be distinct", "[settings][validate]") {
  nspeed::Settings s;
  s.wire.payload_type = s.wire.offer_type;
  REQUIRE(!nspeed::ValidateSettings(s).has_value());
}

TEST_CASE("settings - zero connection counts are valid", "[settings][validate]") {
  nspeed::Settings s;
  s.tcp_connections = 0;
  s.udp_connections = 0;
  s.file_size = 0;
  REQUIRE(nspeed::ValidateSettings(s).has_value());
}

// ============================================================================
// 3. Loading
// ============================================================================

#ifdef NSPEED_CONFIG_INI_ENABLED

static nspeed::expected<void, nspeed::ConfigError> ApplyIni(const char* data,
                                                            nspeed::Settings& s) {
  nspeed::Config<nspeed::IniBackend> cfg;
  auto r = cfg.LoadBuffer(data, static_cast<uint32_t>(std::strlen(data)),
                          nspeed::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  return nspeed::ApplySettings(cfg, s);
}

TEST_CASE("settings - ApplySettings overrides every section", "[settings][load]") {
  nspeed::Settings s;
  auto r = ApplyIni(
      "[protocol]\n"
      "magic_cookie = 0x01020304\n"
      "offer_type = 0x12\n"
      "request_type = 0x13\n"
      "payload_type = 0x14\n"
      "[network]\n"
      "broadcast_port = 14000\n"
      "broadcast_address = 127.0.0.1\n"
      "broadcast_interval = 0.5\n"
      "max_tcp_connections = 16\n"
      "[transfer]\n"
      "segment_size = 1400\n"
      "udp_idle_timeout = 0.3\n"
      "tcp_chunk_size = 8192\n"
      "[client]\n"
      "file_size = 2000000\n"
      "tcp_connections = 4\n"
      "udp_connections = 2\n"
      "[log]\n"
      "level = warn\n",
      s);
  REQUIRE(r.has_value());
  REQUIRE(s.wire.magic_cookie == 0x01020304U);
  REQUIRE(s.wire.offer_type == 0x12);
  REQUIRE(s.wire.request_type == 0x13);
  REQUIRE(s.wire.payload_type == 0x14);
  REQUIRE(s.broadcast_port == 14000);
  REQUIRE(std::strcmp(s.broadcast_address, "127.0.0.1") == 0);
  REQUIRE(s.BroadcastIntervalMs() == 500U);
  REQUIRE(s.max_tcp_connections == 16);
  REQUIRE(s.segment_size == 1400U);
  REQUIRE(s.UdpIdleTimeoutMs() == 300U);
  REQUIRE(s.tcp_chunk_size == 8192U);
  REQUIRE(s.file_size == 2000000U);
  REQUIRE(s.tcp_connections == 4U);
  REQUIRE(s.udp_connections == 2U);
  REQUIRE(s.log_level == nspeed::log::Level::kWarn);
}

TEST_CASE("settings - missing keys keep their values", "[settings][load]") {
  nspeed::Settings s;
  s.file_size = 42;
  auto r = ApplyIni("[transfer]\nsegment_size = 512\n", s);
  REQUIRE(r.has_value());
  REQUIRE(s.segment_size == 512U);
  REQUIRE(s.file_size == 42U);
  REQUIRE(s.broadcast_port == 13117);
}

TEST_CASE("settings - out-of-range type byte is rejected", "[settings][load]") {
  nspeed::Settings s;
  auto r = ApplyIni("[protocol]\noffer_type = 0x100\n", s);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == nspeed::ConfigError::kInvalidValue);
}

TEST_CASE("settings - non-numeric value is rejected", "[settings][load]") {
  nspeed::Settings s;
  auto r = ApplyIni("[transfer]\nsegment_size = big\n", s);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == nspeed::ConfigError::kInvalidValue);
  REQUIRE(s.segment_size == nspeed::kDefaultSegmentSize);
}

TEST_CASE("settings - broadcast port 0 is rejected", "[settings][load]") {
  nspeed::Settings s;
  auto r = ApplyIni("[network]\nbroadcast_port = 0\n", s);
  REQUIRE(!r.has_value());
  REQUIRE(s.broadcast_port == nspeed::kDefaultBroadcastPort);
}

TEST_CASE("settings - unknown log level is rejected", "[settings][load]") {
  nspeed::Settings s;
  auto r = ApplyIni("[log]\nlevel = chatty\n", s);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == nspeed::ConfigError::kInvalidValue);
}

TEST_CASE("settings - invalid segment size from file", "[settings][load]") {
  nspeed::Settings s;
  auto r = ApplyIni("[transfer]\nsegment_size = 70000\n", s);
  REQUIRE(!r.has_value());
}

TEST_CASE("settings - LoadSettings from disk", "[settings][load]") {
  const char* path = "/tmp/__nspeed_test_settings__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[client]\nfile_size = 4096\nudp_connections = 3\n");
  std::fclose(f);

  nspeed::Settings s;
  auto r = nspeed::LoadSettings(path, s);
  REQUIRE(r.has_value());
  REQUIRE(s.file_size == 4096U);
  REQUIRE(s.udp_connections == 3U);
  std::remove(path);
}

#endif  // NSPEED_CONFIG_INI_ENABLED

TEST_CASE("settings - LoadSettings with a missing file keeps defaults", "[settings][load]") {
  nspeed::Settings s;
  auto r = nspeed::LoadSettings("/tmp/__nspeed_no_such_settings__.ini", s);
  REQUIRE(!r.has_value());
  REQUIRE(s.file_size == nspeed::kDefaultFileSize);
  REQUIRE(s.segment_size == nspeed::kDefaultSegmentSize);
}

// ============================================================================
// 4. Command line helpers
// ============================================================================

TEST_CASE("settings - FindArg", "[settings][args]") {
  char prog[] = "nspeed_client";
  char flag[] = "--size";
  char value[] = "5000";
  char tail[] = "--batch";
  char* argv[] = {prog, flag, value, tail};

  REQUIRE(std::strcmp(nspeed::FindArg(4, argv, "--size"), "5000") == 0);
  REQUIRE(nspeed::FindArg(4, argv, "--tcp") == nullptr);
  // A flag in last position has no value.
  REQUIRE(nspeed::FindArg(4, argv, "--batch") == nullptr);
}

TEST_CASE("settings - ParseCount", "[settings][args]") {
  uint64_t v = 99;
  REQUIRE(nspeed::ParseCount("1000000", v));
  REQUIRE(v == 1000000U);
  REQUIRE(nspeed::ParseCount(" 4\n", v));
  REQUIRE(v == 4U);
  REQUIRE(nspeed::ParseCount("0", v));
  REQUIRE(v == 0U);
  REQUIRE(nspeed::ParseCount("-7", v));
  REQUIRE(v == 0U);
}

TEST_CASE("settings - ParseCount rejects non-numeric input", "[settings][args]") {
  uint64_t v = 5;
  REQUIRE_FALSE(nspeed::ParseCount("", v));
  REQUIRE_FALSE(nspeed::ParseCount("abc", v));
  REQUIRE_FALSE(nspeed::ParseCount("12abc", v));
  REQUIRE_FALSE(nspeed::ParseCount(nullptr, v));
  REQUIRE(v == 5U);
}

TEST_CASE("settings - blank answer keeps the configured count", "[settings][args]") {
  uint64_t v = 0;
  REQUIRE(nspeed::ParseCountOrKeep("\n", 5000000U, v));
  REQUIRE(v == 5000000U);
  v = 0;
  REQUIRE(nspeed::ParseCountOrKeep("  \r\n", 4U, v));
  REQUIRE(v == 4U);
  REQUIRE(nspeed::ParseCountOrKeep("12\n", 4U, v));
  REQUIRE(v == 12U);
  REQUIRE_FALSE(nspeed::ParseCountOrKeep("abc\n", 4U, v));
  REQUIRE_FALSE(nspeed::ParseCountOrKeep(nullptr, 4U, v));
}
