// Repository: MirrorCast
// Component: Frame Reassembler
// Purpose: Rebuild encoded frames from lossy, out-of-order media datagrams.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_MEDIA_FRAME_REASSEMBLER_H_
#define MIRRORCAST_MEDIA_FRAME_REASSEMBLER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "mirrorcast/media/Frame.h"

namespace mirrorcast::media {

// ReassemblerStats feeds fps/kbps/drop telemetry.
struct ReassemblerStats {
  uint64_t frames_completed = 0;
  uint64_t frames_dropped = 0;       // In-flight frames evicted before completion
  uint64_t malformed_datagrams = 0;  // Header decode failures / inconsistent parts
  uint64_t stale_datagrams = 0;      // Parts of frames older than the current one
  uint64_t duplicate_parts = 0;
  uint64_t bytes_received = 0;
  uint32_t last_completed_seq = 0;
  double fps = 0.0;
  double kbps = 0.0;
};

// FrameReassembler keeps at most one in-flight frame.
//
// Policy:
// - A datagram for a sequence-newer frame evicts the in-flight frame (counted
//   as a drop). Video recovers at the next keyframe, and memory stays bounded
//   to one frame.
// - Datagrams for older frames are stale and discarded.
// - Sequence order uses the signed 32-bit delta, so it survives wraparound.
// - A restarted sender is picked up only after Reset(), which the receiver
//   calls whenever it stops.
//
// Thread Model:
// - Not thread-safe. Owned by a single receive thread.
class FrameReassembler {
 public:
  FrameReassembler();

  // Ingests one datagram received at now_utc_us.
  // Returns the complete frame when this datagram finishes one.
  std::optional<Frame> Ingest(const uint8_t* data, std::size_t size, int64_t now_utc_us);

  // Discards the in-flight frame without delivering it, and forgets the
  // sequence position.
  void Reset();

  bool HasInFlight() const { return in_flight_.has_value(); }
  std::optional<uint32_t> InFlightSeq() const;

  const ReassemblerStats& stats() const { return stats_; }

 private:
  struct InFlightFrame {
    uint32_t seq = 0;
    uint16_t part_count = 0;
    std::vector<bool> received_mask;
    std::vector<std::vector<uint8_t>> buffers;
    std::size_t received_parts = 0;
    std::optional<std::vector<uint8_t>> param_set_blob;
    uint16_t width = 0;
    uint16_t height = 0;
    bool is_keyframe = false;
    int64_t first_seen_utc_us = 0;
  };

  bool IsStale(uint32_t seq) const;
  void StartFrame(uint32_t seq, uint16_t part_count, int64_t now_utc_us);
  Frame CompleteFrame();
  void UpdateRates(int64_t now_utc_us);

  std::optional<InFlightFrame> in_flight_;
  std::optional<uint32_t> last_completed_seq_;

  ReassemblerStats stats_;
  int64_t window_start_utc_us_;
  uint64_t frames_in_window_;
  uint64_t bytes_in_window_;
};

}  // namespace mirrorcast::media

#endif  // MIRRORCAST_MEDIA_FRAME_REASSEMBLER_H_
