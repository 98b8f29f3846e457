/**
 * @file test_stats.cpp
 * @brief Tests for stats.hpp: segmentation, rates and the UDP tally.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "nspeed/stats.hpp"

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// 1. Segmentation
// ============================================================================

TEST_CASE("stats - SegmentCount rounds up", "[stats][segment]") {
  REQUIRE(nspeed::SegmentCount(1000000U, 1024U) == 977U);
  REQUIRE(nspeed::SegmentCount(1024U, 1024U) == 1U);
  REQUIRE(nspeed::SegmentCount(1025U, 1024U) == 2U);
  REQUIRE(nspeed::SegmentCount(1U, 1024U) == 1U);
  REQUIRE(nspeed::SegmentCount(0U, 1024U) == 0U);
}

TEST_CASE("stats - last segment carries the remainder", "[stats][segment]") {
  REQUIRE(nspeed::SegmentLength(1U, 1000000U, 1024U) == 1024U);
  REQUIRE(nspeed::SegmentLength(976U, 1000000U, 1024U) == 1024U);
  REQUIRE(nspeed::SegmentLength(977U, 1000000U, 1024U) == 576U);
}

TEST_CASE("stats - exact multiple has a full last segment", "[stats][segment]") {
  REQUIRE(nspeed::SegmentLength(2U, 2048U, 1024U) == 1024U);
}

TEST_CASE("stats - out-of-range segment index has no payload", "[stats][segment]") {
  REQUIRE(nspeed::SegmentLength(0U, 1000U, 1024U) == 0U);
  REQUIRE(nspeed::SegmentLength(2U, 1000U, 1024U) == 0U);
  REQUIRE(nspeed::SegmentLength(1U, 0U, 1024U) == 0U);
}

TEST_CASE("stats - segment count does not wrap near the 64-bit limit", "[stats][segment]") {
  const uint64_t file_size = UINT64_MAX;
  const uint64_t total = nspeed::SegmentCount(file_size, 1024U);
  REQUIRE(total == 18014398509481984ULL);
  REQUIRE(nspeed::SegmentLength(1U, file_size, 1024U) == 1024U);
  REQUIRE(nspeed::SegmentLength(total, file_size, 1024U) == 1023U);
  REQUIRE(nspeed::SegmentCount(file_size, 1U) == UINT64_MAX);
}

TEST_CASE("stats - segment lengths add up to the file size", "[stats][segment]") {
  const uint64_t file_size = 123457U;
  const uint32_t seg = 1000U;
  uint64_t sum = 0;
  for (uint64_t i = 1; i <= nspeed::SegmentCount(file_size, seg); ++i) {
    sum += nspeed::SegmentLength(i, file_size, seg);
  }
  REQUIRE(sum == file_size);
}

// ============================================================================
// 2. Rates
// ============================================================================

TEST_CASE("stats - bits per second", "[stats][rate]") {
  REQUIRE_THAT(nspeed::BitsPerSecond(1000000U, 2.0), WithinRel(4000000.0, 1e-9));
  REQUIRE_THAT(nspeed::BitsPerSecond(0U, 1.0), WithinAbs(0.0, 1e-12));
}

TEST_CASE("stats - zero elapsed time stays finite", "[stats][rate]") {
  REQUIRE(nspeed::ClampElapsed(0.0) == nspeed::kMinElapsedSeconds);
  REQUIRE(nspeed::ClampElapsed(-1.0) == nspeed::kMinElapsedSeconds);
  REQUIRE_THAT(nspeed::BitsPerSecond(1U, 0.0), WithinRel(8e6, 1e-9));
}

TEST_CASE("stats - loss percent", "[stats][loss]") {
  REQUIRE_THAT(nspeed::LossPercent(977U, 977U), WithinAbs(0.0, 1e-9));
  REQUIRE_THAT(nspeed::LossPercent(0U, 10U), WithinAbs(100.0, 1e-9));
  REQUIRE_THAT(nspeed::LossPercent(3U, 4U), WithinAbs(25.0, 1e-9));
  REQUIRE_THAT(nspeed::LossPercent(0U, 0U), WithinAbs(0.0, 1e-9));
}

TEST_CASE("stats - duplicates make loss negative", "[stats][loss]") {
  REQUIRE_THAT(nspeed::LossPercent(12U, 10U), WithinAbs(-20.0, 1e-9));
}

TEST_CASE("stats - TcpStats helpers", "[stats][tcp]") {
  nspeed::TcpStats s;
  s.requested_bytes = 100;
  s.bytes_received = 100;
  s.elapsed_s = 0.5;
  REQUIRE(s.Complete());
  REQUIRE_THAT(s.BitsPerSecond(), WithinRel(1600.0, 1e-9));

  s.bytes_received = 40;
  REQUIRE_FALSE(s.Complete());
}

// ============================================================================
// 3. UdpReceiveTally
// ============================================================================

TEST_CASE("stats - tally with nothing received", "[stats][tally]") {
  nspeed::UdpReceiveTally t;
  REQUIRE(t.Received() == 0U);
  REQUIRE(t.Expected() == 0U);
  REQUIRE_THAT(t.LossPercent(), WithinAbs(0.0, 1e-9));

  nspeed::UdpStats s = t.ToStats(1, 1000, 0.0);
  REQUIRE(s.segments_expected == 0U);
  REQUIRE(s.elapsed_s == nspeed::kMinElapsedSeconds);
  REQUIRE_THAT(s.SuccessPercent(), WithinAbs(100.0, 1e-9));
}

TEST_CASE("stats - tally latches the first total", "[stats][tally]") {
  nspeed::UdpReceiveTally t;
  t.OnPayload(4, 1024);
  t.OnPayload(99, 1024);
  t.OnPayload(4, 512);
  REQUIRE(t.Expected() == 4U);
  REQUIRE(t.Received() == 3U);
  REQUIRE(t.Bytes() == 2560U);
  REQUIRE_THAT(t.LossPercent(), WithinAbs(25.0, 1e-9));
}

TEST_CASE("stats - tally with a zero total uses the received count", "[stats][tally]") {
  nspeed::UdpReceiveTally t;
  t.OnPayload(0, 10);
  t.OnPayload(0, 10);
  REQUIRE(t.Expected() == 2U);
  REQUIRE_THAT(t.LossPercent(), WithinAbs(0.0, 1e-9));
}

TEST_CASE("stats - tally counts duplicates", "[stats][tally]") {
  nspeed::UdpReceiveTally t;
  t.OnPayload(2, 10);
  t.OnPayload(2, 10);
  t.OnPayload(2, 10);
  REQUIRE(t.Received() == 3U);
  REQUIRE_THAT(t.LossPercent(), WithinAbs(-50.0, 1e-9));
}

TEST_CASE("stats - ToStats copies every field", "[stats][tally]") {
  nspeed::UdpReceiveTally t;
  t.OnPayload(2, 1024);
  nspeed::UdpStats s = t.ToStats(3, 2000, 2.0);
  REQUIRE(s.connection_id == 3U);
  REQUIRE(s.requested_bytes == 2000U);
  REQUIRE(s.bytes_received == 1024U);
  REQUIRE(s.segments_received == 1U);
  REQUIRE(s.segments_expected == 2U);
  REQUIRE_THAT(s.BitsPerSecond(), WithinRel(4096.0, 1e-9));
  REQUIRE_THAT(s.SuccessPercent(), WithinAbs(50.0, 1e-9));
}
