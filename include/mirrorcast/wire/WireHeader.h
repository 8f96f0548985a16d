// Repository: MirrorCast
// Component: Wire Header Codec
// Purpose: Fixed 20-byte big-endian media datagram header and param-set blob.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_WIRE_WIRE_HEADER_H_
#define MIRRORCAST_WIRE_WIRE_HEADER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "mirrorcast/media/Frame.h"

namespace mirrorcast::wire {

// 'MCRV'
constexpr uint32_t kWireMagic = 0x4D435256;
constexpr std::size_t kWireHeaderBytes = 20;

constexpr uint16_t kFlagKeyframe = 1u << 0;
constexpr uint16_t kFlagHasParamSet = 1u << 1;

// WireHeader precedes every media datagram.
//
// Layout (big-endian, in order):
//   magic:u32 seq:u32 part_index:u16 part_count:u16 flags:u16
//   width:u16 height:u16 config_bytes:u16
//
// config_bytes is only non-zero on part 0 of a frame that carries param sets.
struct WireHeader {
  uint32_t seq = 0;
  uint16_t part_index = 0;
  uint16_t part_count = 0;
  uint16_t flags = 0;
  uint16_t width = 0;
  uint16_t height = 0;
  uint16_t config_bytes = 0;

  bool is_keyframe() const { return (flags & kFlagKeyframe) != 0; }
  bool has_param_set() const { return (flags & kFlagHasParamSet) != 0; }

  bool operator==(const WireHeader& other) const {
    return seq == other.seq && part_index == other.part_index &&
           part_count == other.part_count && flags == other.flags &&
           width == other.width && height == other.height &&
           config_bytes == other.config_bytes;
  }
};

// Appends the 20 encoded header bytes to out.
void EncodeHeader(const WireHeader& header, std::vector<uint8_t>& out);

// Decodes the header at the start of data.
// Returns std::nullopt (MalformedHeader) when the buffer is shorter than the
// header, the magic does not match, or the part/config fields are
// inconsistent. Callers discard the datagram on failure.
std::optional<WireHeader> DecodeHeader(const uint8_t* data, std::size_t size);

// Returns true if a is newer than b under modular u32 arithmetic.
inline bool IsSequenceNewer(uint32_t a, uint32_t b) {
  return static_cast<int32_t>(a - b) > 0;
}

// Param-set blob: [u8 sps_count][u8 pps_count] then each SPS, then each PPS,
// as [u16 length][bytes].
std::vector<uint8_t> EncodeParamSets(const media::ParamSets& param_sets);

// Returns std::nullopt on a truncated or inconsistent blob.
std::optional<media::ParamSets> DecodeParamSets(const uint8_t* data, std::size_t size);

}  // namespace mirrorcast::wire

#endif  // MIRRORCAST_WIRE_WIRE_HEADER_H_
