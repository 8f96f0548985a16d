// Repository: MirrorCast
// Component: Frame Fragmenter
// Purpose: Split one encoded frame into MTU-sized media datagrams.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/media/FrameFragmenter.h"

#include <algorithm>
#include <iostream>
#include <limits>

#include "mirrorcast/wire/WireHeader.h"

namespace mirrorcast::media {

namespace {

uint16_t ClampDimension(int value) {
  if (value <= 0) {
    return 0;
  }
  return static_cast<uint16_t>(
      std::min<int>(value, std::numeric_limits<uint16_t>::max()));
}

}  // namespace

FrameFragmenter::FrameFragmenter(std::size_t mtu) : mtu_(mtu) {}

std::vector<std::vector<uint8_t>> FrameFragmenter::Fragment(const Frame& frame,
                                                            uint32_t& seq) const {
  std::vector<std::vector<uint8_t>> datagrams;

  std::vector<uint8_t> config_blob;
  if (frame.is_keyframe && frame.param_sets.has_value()) {
    config_blob = wire::EncodeParamSets(*frame.param_sets);
  }

  const std::size_t header = wire::kWireHeaderBytes;
  if (mtu_ <= header + config_blob.size() ||
      config_blob.size() > std::numeric_limits<uint16_t>::max()) {
    std::cerr << "[FrameFragmenter] MTU " << mtu_ << " cannot carry header + "
              << config_blob.size() << " config bytes; frame not sent" << std::endl;
    return datagrams;
  }
  const std::size_t first_budget = mtu_ - header - config_blob.size();
  const std::size_t rest_budget = mtu_ - header;

  const std::size_t total = frame.payload.size();
  std::size_t part_count = 1;
  if (total > first_budget) {
    part_count = 1 + (total - first_budget + rest_budget - 1) / rest_budget;
  }
  if (part_count > std::numeric_limits<uint16_t>::max()) {
    std::cerr << "[FrameFragmenter] Frame of " << total << " bytes needs " << part_count
              << " parts at MTU " << mtu_ << "; frame not sent" << std::endl;
    return datagrams;
  }

  uint16_t flags = 0;
  if (frame.is_keyframe) {
    flags |= wire::kFlagKeyframe;
  }
  if (!config_blob.empty()) {
    flags |= wire::kFlagHasParamSet;
  }

  datagrams.reserve(part_count);
  std::size_t offset = 0;
  for (std::size_t index = 0; index < part_count; ++index) {
    const bool carries_config = index == 0 && !config_blob.empty();
    const std::size_t budget = index == 0 ? first_budget : rest_budget;
    const std::size_t take = std::min(budget, total - offset);

    wire::WireHeader hdr;
    hdr.seq = seq;
    hdr.part_index = static_cast<uint16_t>(index);
    hdr.part_count = static_cast<uint16_t>(part_count);
    hdr.flags = flags;
    hdr.width = ClampDimension(frame.width);
    hdr.height = ClampDimension(frame.height);
    hdr.config_bytes = carries_config ? static_cast<uint16_t>(config_blob.size()) : 0;

    std::vector<uint8_t> datagram;
    datagram.reserve(header + (carries_config ? config_blob.size() : 0) + take);
    wire::EncodeHeader(hdr, datagram);
    if (carries_config) {
      datagram.insert(datagram.end(), config_blob.begin(), config_blob.end());
    }
    datagram.insert(datagram.end(),
                    frame.payload.begin() + static_cast<std::ptrdiff_t>(offset),
                    frame.payload.begin() + static_cast<std::ptrdiff_t>(offset + take));
    offset += take;

    datagrams.push_back(std::move(datagram));
  }

  ++seq;
  return datagrams;
}

}  // namespace mirrorcast::media
