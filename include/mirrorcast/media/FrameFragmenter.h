// Repository: MirrorCast
// Component: Frame Fragmenter
// Purpose: Split one encoded frame into MTU-sized media datagrams.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_MEDIA_FRAME_FRAGMENTER_H_
#define MIRRORCAST_MEDIA_FRAME_FRAGMENTER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "mirrorcast/media/Frame.h"

namespace mirrorcast::media {

// Stays under common Wi-Fi path MTUs so the IP layer never fragments.
constexpr std::size_t kDefaultMtu = 1200;

// FrameFragmenter turns one Frame into partCount datagrams.
//
// Part 0 carries the param-set blob (keyframes with param sets only) followed
// by the first payload slice. Later parts carry payload slices of at most
// mtu - header bytes. Every part of one frame shares seq and flags.
//
// The sequence counter is owned by the caller and incremented once per frame
// after all parts are built; it wraps on overflow.
class FrameFragmenter {
 public:
  explicit FrameFragmenter(std::size_t mtu = kDefaultMtu);

  // Returns the datagrams for frame, or an empty vector when the MTU cannot
  // hold the header plus config blob (configuration error). seq is left
  // untouched in that case.
  std::vector<std::vector<uint8_t>> Fragment(const Frame& frame, uint32_t& seq) const;

  std::size_t mtu() const { return mtu_; }

 private:
  std::size_t mtu_;
};

}  // namespace mirrorcast::media

#endif  // MIRRORCAST_MEDIA_FRAME_FRAGMENTER_H_
