// Repository: MirrorCast
// Component: Frame Reassembler
// Purpose: Rebuild encoded frames from lossy, out-of-order media datagrams.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/media/FrameReassembler.h"

#include "mirrorcast/wire/WireHeader.h"

namespace mirrorcast::media {

namespace {

constexpr int64_t kRateWindowUs = 1'000'000;

}  // namespace

FrameReassembler::FrameReassembler()
    : window_start_utc_us_(-1),
      frames_in_window_(0),
      bytes_in_window_(0) {}

std::optional<uint32_t> FrameReassembler::InFlightSeq() const {
  if (!in_flight_) {
    return std::nullopt;
  }
  return in_flight_->seq;
}

std::optional<Frame> FrameReassembler::Ingest(const uint8_t* data,
                                              std::size_t size,
                                              int64_t now_utc_us) {
  stats_.bytes_received += size;
  bytes_in_window_ += size;
  UpdateRates(now_utc_us);

  const auto header = wire::DecodeHeader(data, size);
  if (!header) {
    ++stats_.malformed_datagrams;
    return std::nullopt;
  }

  if (IsStale(header->seq)) {
    ++stats_.stale_datagrams;
    return std::nullopt;
  }

  if (in_flight_ && in_flight_->seq != header->seq) {
    // Newest frame wins; the incomplete one is gone for good.
    ++stats_.frames_dropped;
    in_flight_.reset();
  }
  if (!in_flight_) {
    StartFrame(header->seq, header->part_count, now_utc_us);
  }

  InFlightFrame& frame = *in_flight_;
  if (header->part_count != frame.part_count) {
    ++stats_.malformed_datagrams;
    return std::nullopt;
  }
  if (frame.received_mask[header->part_index]) {
    ++stats_.duplicate_parts;
    return std::nullopt;
  }

  std::size_t body_offset = wire::kWireHeaderBytes;
  if (header->part_index == 0 && header->has_param_set() && header->config_bytes > 0) {
    const uint8_t* blob = data + body_offset;
    frame.param_set_blob.emplace(blob, blob + header->config_bytes);
    body_offset += header->config_bytes;
  }

  frame.buffers[header->part_index].assign(data + body_offset, data + size);
  frame.received_mask[header->part_index] = true;
  ++frame.received_parts;
  frame.is_keyframe = header->is_keyframe();
  frame.width = header->width;
  frame.height = header->height;

  if (frame.received_parts < frame.part_count) {
    return std::nullopt;
  }
  return CompleteFrame();
}

void FrameReassembler::Reset() {
  if (in_flight_) {
    ++stats_.frames_dropped;
  }
  in_flight_.reset();
  last_completed_seq_.reset();
}

bool FrameReassembler::IsStale(uint32_t seq) const {
  if (in_flight_) {
    return static_cast<int32_t>(seq - in_flight_->seq) < 0;
  }
  if (last_completed_seq_) {
    return static_cast<int32_t>(seq - *last_completed_seq_) <= 0;
  }
  return false;
}

void FrameReassembler::StartFrame(uint32_t seq, uint16_t part_count, int64_t now_utc_us) {
  InFlightFrame frame;
  frame.seq = seq;
  frame.part_count = part_count;
  frame.received_mask.assign(part_count, false);
  frame.buffers.resize(part_count);
  frame.first_seen_utc_us = now_utc_us;
  in_flight_ = std::move(frame);
}

Frame FrameReassembler::CompleteFrame() {
  InFlightFrame& in_flight = *in_flight_;

  Frame frame;
  std::size_t total = 0;
  for (const auto& buffer : in_flight.buffers) {
    total += buffer.size();
  }
  frame.payload.reserve(total);
  for (const auto& buffer : in_flight.buffers) {
    frame.payload.insert(frame.payload.end(), buffer.begin(), buffer.end());
  }
  frame.is_keyframe = in_flight.is_keyframe;
  frame.width = in_flight.width;
  frame.height = in_flight.height;
  if (in_flight.param_set_blob) {
    frame.param_sets = wire::DecodeParamSets(in_flight.param_set_blob->data(),
                                             in_flight.param_set_blob->size());
  }

  last_completed_seq_ = in_flight.seq;
  stats_.last_completed_seq = in_flight.seq;
  ++stats_.frames_completed;
  ++frames_in_window_;
  in_flight_.reset();
  return frame;
}

void FrameReassembler::UpdateRates(int64_t now_utc_us) {
  if (window_start_utc_us_ < 0) {
    window_start_utc_us_ = now_utc_us;
    return;
  }
  const int64_t elapsed_us = now_utc_us - window_start_utc_us_;
  if (elapsed_us < kRateWindowUs) {
    return;
  }
  const double seconds = static_cast<double>(elapsed_us) / 1'000'000.0;
  stats_.fps = static_cast<double>(frames_in_window_) / seconds;
  stats_.kbps = static_cast<double>(bytes_in_window_ * 8) / seconds / 1'000.0;
  window_start_utc_us_ = now_utc_us;
  frames_in_window_ = 0;
  bytes_in_window_ = 0;
}

}  // namespace mirrorcast::media
