// Repository: MirrorCast
// Component: Encoded Frame
// Purpose: Encoder output / decoder input contract for one compressed picture.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_MEDIA_FRAME_H_
#define MIRRORCAST_MEDIA_FRAME_H_

#include <cstdint>
#include <optional>
#include <vector>

namespace mirrorcast::media {

// ParamSets holds the H.264 SPS and PPS NAL units (without length prefixes).
struct ParamSets {
  std::vector<std::vector<uint8_t>> sps;
  std::vector<std::vector<uint8_t>> pps;

  bool operator==(const ParamSets& other) const {
    return sps == other.sps && pps == other.pps;
  }
  bool operator!=(const ParamSets& other) const { return !(*this == other); }
};

// Frame is one encoded picture.
// payload is AVCC: each NAL unit prefixed by a 4-byte big-endian length.
// param_sets is only meaningful on keyframes.
struct Frame {
  std::vector<uint8_t> payload;
  bool is_keyframe;
  std::optional<ParamSets> param_sets;
  int width;
  int height;

  Frame() : is_keyframe(false), width(0), height(0) {}
};

// FrameSink receives complete frames from the reassembler (decoder side).
class FrameSink {
 public:
  virtual ~FrameSink() = default;

  // Called on the receive thread, once per complete frame.
  virtual void OnReassembledFrame(const Frame& frame) = 0;
};

}  // namespace mirrorcast::media

#endif  // MIRRORCAST_MEDIA_FRAME_H_
