// Repository: MirrorCast
// Component: Wire Header Codec
// Purpose: Fixed 20-byte big-endian media datagram header and param-set blob.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/wire/WireHeader.h"

#include <algorithm>

#include "mirrorcast/wire/ByteOrder.h"

namespace mirrorcast::wire {

namespace {

constexpr std::size_t kMaxParamSetsPerKind = 255;
constexpr std::size_t kMaxParamSetBytes = 0xFFFF;

bool ReadParamSetList(const uint8_t* data,
                      std::size_t size,
                      std::size_t count,
                      std::size_t& offset,
                      std::vector<std::vector<uint8_t>>& out) {
  for (std::size_t i = 0; i < count; ++i) {
    if (offset + 2 > size) {
      return false;
    }
    const std::size_t length = ReadU16BE(data + offset);
    offset += 2;
    if (offset + length > size) {
      return false;
    }
    out.emplace_back(data + offset, data + offset + length);
    offset += length;
  }
  return true;
}

}  // namespace

void EncodeHeader(const WireHeader& header, std::vector<uint8_t>& out) {
  out.reserve(out.size() + kWireHeaderBytes);
  AppendU32BE(out, kWireMagic);
  AppendU32BE(out, header.seq);
  AppendU16BE(out, header.part_index);
  AppendU16BE(out, header.part_count);
  AppendU16BE(out, header.flags);
  AppendU16BE(out, header.width);
  AppendU16BE(out, header.height);
  AppendU16BE(out, header.config_bytes);
}

std::optional<WireHeader> DecodeHeader(const uint8_t* data, std::size_t size) {
  if (data == nullptr || size < kWireHeaderBytes) {
    return std::nullopt;
  }
  if (ReadU32BE(data) != kWireMagic) {
    return std::nullopt;
  }

  WireHeader header;
  header.seq = ReadU32BE(data + 4);
  header.part_index = ReadU16BE(data + 8);
  header.part_count = ReadU16BE(data + 10);
  header.flags = ReadU16BE(data + 12);
  header.width = ReadU16BE(data + 14);
  header.height = ReadU16BE(data + 16);
  header.config_bytes = ReadU16BE(data + 18);

  if (header.part_count == 0 || header.part_index >= header.part_count) {
    return std::nullopt;
  }
  if (header.config_bytes > 0 &&
      (header.part_index != 0 || !header.has_param_set())) {
    return std::nullopt;
  }
  if (kWireHeaderBytes + header.config_bytes > size) {
    return std::nullopt;
  }
  return header;
}

std::vector<uint8_t> EncodeParamSets(const media::ParamSets& param_sets) {
  const std::size_t sps_count = std::min(param_sets.sps.size(), kMaxParamSetsPerKind);
  const std::size_t pps_count = std::min(param_sets.pps.size(), kMaxParamSetsPerKind);

  std::vector<uint8_t> out;
  out.push_back(static_cast<uint8_t>(sps_count));
  out.push_back(static_cast<uint8_t>(pps_count));

  auto append_list = [&out](const std::vector<std::vector<uint8_t>>& list,
                            std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
      const std::size_t length = std::min(list[i].size(), kMaxParamSetBytes);
      AppendU16BE(out, static_cast<uint16_t>(length));
      out.insert(out.end(), list[i].begin(), list[i].begin() + length);
    }
  };
  append_list(param_sets.sps, sps_count);
  append_list(param_sets.pps, pps_count);
  return out;
}

std::optional<media::ParamSets> DecodeParamSets(const uint8_t* data, std::size_t size) {
  if (data == nullptr || size < 2) {
    return std::nullopt;
  }
  const std::size_t sps_count = data[0];
  const std::size_t pps_count = data[1];

  media::ParamSets param_sets;
  std::size_t offset = 2;
  if (!ReadParamSetList(data, size, sps_count, offset, param_sets.sps)) {
    return std::nullopt;
  }
  if (!ReadParamSetList(data, size, pps_count, offset, param_sets.pps)) {
    return std::nullopt;
  }
  return param_sets;
}

}  // namespace mirrorcast::wire
