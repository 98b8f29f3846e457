/**
 * @file stats.hpp
 * @brief Segmentation arithmetic and transfer statistics.
 */

#ifndef NSPEED_STATS_HPP_
#define NSPEED_STATS_HPP_

#include "nspeed/platform.hpp"

#include <cstdint>

namespace nspeed {

constexpr uint32_t kDefaultSegmentSize = 1024U;

/// Content of every TCP and UDP download body.
constexpr char kFillerByte = 'a';

/// Stand-in for a zero elapsed time so bitrates stay finite.
constexpr double kMinElapsedSeconds = 1e-6;

// ============================================================================
// Segmentation
// ============================================================================

/** @brief ceil(file_size / segment_size); 0 for an empty file. */
inline uint64_t SegmentCount(uint64_t file_size, uint32_t segment_size) noexcept {
  NSPEED_ASSERT(segment_size > 0U);
  return file_size / segment_size + ((file_size % segment_size != 0U) ? 1U : 0U);
}

/**
 * @brief Payload length of 1-based segment @p index.
 *
 * Every segment is @p segment_size bytes except the last, which carries the
 * remainder. Out-of-range indices yield 0.
 */
inline uint32_t SegmentLength(uint64_t index, uint64_t file_size,
                              uint32_t segment_size) noexcept {
  const uint64_t total = SegmentCount(file_size, segment_size);
  if (index == 0U || index > total) return 0U;
  if (index < total) return segment_size;
  const uint64_t rem = file_size - (total - 1U) * segment_size;
  return static_cast<uint32_t>(rem);
}

// ============================================================================
// Rates
// ============================================================================

inline double ClampElapsed(double seconds) noexcept {
  return (seconds > 0.0) ? seconds : kMinElapsedSeconds;
}

inline double BitsPerSecond(uint64_t bytes, double elapsed_s) noexcept {
  return 8.0 * static_cast<double>(bytes) / ClampElapsed(elapsed_s);
}

/**
 * @brief 100 * (1 - received / expected).
 *
 * Not clamped: duplicated datagrams push it below zero. With nothing expected
 * the loss is 0.
 */
inline double LossPercent(uint64_t received, uint64_t expected) noexcept {
  if (expected == 0U) return 0.0;
  return 100.0 * (1.0 - static_cast<double>(received) /
                            static_cast<double>(expected));
}

// ============================================================================
// Per-connection results
// ============================================================================

struct TcpStats {
  uint32_t connection_id = 0;
  uint64_t requested_bytes = 0;
  uint64_t bytes_received = 0;
  double elapsed_s = kMinElapsedSeconds;

  double BitsPerSecond() const noexcept {
    return ::nspeed::BitsPerSecond(bytes_received, elapsed_s);
  }
  bool Complete() const noexcept { return bytes_received == requested_bytes; }
};

struct UdpStats {
  uint32_t connection_id = 0;
  uint64_t requested_bytes = 0;
  uint64_t bytes_received = 0;
  uint64_t segments_received = 0;
  uint64_t segments_expected = 0;
  double elapsed_s = kMinElapsedSeconds;

  double BitsPerSecond() const noexcept {
    return ::nspeed::BitsPerSecond(bytes_received, elapsed_s);
  }
  double LossPercent() const noexcept {
    return ::nspeed::LossPercent(segments_received, segments_expected);
  }
  double SuccessPercent() const noexcept { return 100.0 - LossPercent(); }
};

// ============================================================================
// UdpReceiveTally
// ============================================================================

/**
 * @brief Counts decoded payloads for one UDP download.
 *
 * The first payload's total_segments is latched as the expected count;
 * later values are not re-checked. Duplicates are counted again.
 */
class UdpReceiveTally {
 public:
  void OnPayload(uint64_t total_segments, uint32_t payload_len) noexcept {
    if (!latched_) {
      expected_ = total_segments;
      latched_ = true;
    }
    ++received_;
    bytes_ += payload_len;
  }

  uint64_t Received() const noexcept { return received_; }
  uint64_t Bytes() const noexcept { return bytes_; }

  /// Latched total; the received count when nothing (or a zero total) was latched.
  uint64_t Expected() const noexcept {
    return (latched_ && expected_ != 0U) ? expected_ : received_;
  }

  double LossPercent() const noexcept {
    return ::nspeed::LossPercent(received_, Expected());
  }

  UdpStats ToStats(uint32_t connection_id, uint64_t requested,
                   double elapsed_s) const noexcept {
    UdpStats s;
    s.connection_id = connection_id;
    s.requested_bytes = requested;
    s.bytes_received = bytes_;
    s.segments_received = received_;
    s.segments_expected = Expected();
    s.elapsed_s = ClampElapsed(elapsed_s);
    return s;
  }

 private:
  uint64_t expected_ = 0;
  uint64_t received_ = 0;
  uint64_t bytes_ = 0;
  bool latched_ = false;
};

}  // namespace nspeed

#endif  // NSPEED_STATS_HPP_
