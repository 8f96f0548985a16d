// Repository: MirrorCast
// Component: H.264 Decoder Sink
// Purpose: Decodes reassembled AVCC frames with libavcodec.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/decode/H264Decoder.h"

#include <cstring>
#include <iostream>
#include <string>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

namespace mirrorcast::decode {

namespace {

std::string AvError(int code) {
  char text[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, text, sizeof(text));
  return text;
}

void AppendLengthPrefixed(std::vector<uint8_t>& out, const std::vector<uint8_t>& unit) {
  out.push_back(static_cast<uint8_t>((unit.size() >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(unit.size() & 0xFF));
  out.insert(out.end(), unit.begin(), unit.end());
}

}  // namespace

std::vector<uint8_t> BuildAvcDecoderConfig(const media::ParamSets& param_sets) {
  std::vector<uint8_t> record;
  if (param_sets.sps.empty() || param_sets.sps.front().size() < 4 ||
      param_sets.sps.size() > 31 || param_sets.pps.size() > 255) {
    return record;
  }
  const auto& sps = param_sets.sps.front();
  record.push_back(1);       // configurationVersion
  record.push_back(sps[1]);  // AVCProfileIndication
  record.push_back(sps[2]);  // profile_compatibility
  record.push_back(sps[3]);  // AVCLevelIndication
  record.push_back(0xFF);    // 6 reserved bits + lengthSizeMinusOne = 3
  record.push_back(static_cast<uint8_t>(0xE0 | param_sets.sps.size()));
  for (const auto& unit : param_sets.sps) {
    if (unit.size() > 0xFFFF) {
      return {};
    }
    AppendLengthPrefixed(record, unit);
  }
  record.push_back(static_cast<uint8_t>(param_sets.pps.size()));
  for (const auto& unit : param_sets.pps) {
    if (unit.size() > 0xFFFF) {
      return {};
    }
    AppendLengthPrefixed(record, unit);
  }
  return record;
}

H264Decoder::H264Decoder()
    : codec_ctx_(nullptr),
      frame_(nullptr),
      packet_(nullptr),
      awaiting_keyframe_(true) {}

H264Decoder::~H264Decoder() { CloseCodec(); }

void H264Decoder::SetPictureCallback(PictureCallback callback) {
  callback_ = std::move(callback);
}

void H264Decoder::OnReassembledFrame(const media::Frame& frame) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_received++;
  }

  if (frame.is_keyframe && frame.param_sets &&
      (!current_params_ || !(*current_params_ == *frame.param_sets))) {
    if (!OpenCodec(*frame.param_sets)) {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.decode_errors++;
      return;
    }
  }

  if (codec_ctx_ == nullptr || (awaiting_keyframe_ && !frame.is_keyframe)) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_skipped++;
    return;
  }

  if (Decode(frame)) {
    awaiting_keyframe_ = false;
  } else {
    awaiting_keyframe_ = true;
  }
}

DecoderStats H264Decoder::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

bool H264Decoder::OpenCodec(const media::ParamSets& param_sets) {
  CloseCodec();

  const std::vector<uint8_t> avcc = BuildAvcDecoderConfig(param_sets);
  if (avcc.empty()) {
    std::cerr << "[H264Decoder] Parameter sets unusable; waiting for next keyframe"
              << std::endl;
    return false;
  }

  const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_H264);
  if (!codec) {
    std::cerr << "[H264Decoder] H.264 decoder not available in libavcodec" << std::endl;
    return false;
  }
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    std::cerr << "[H264Decoder] Failed to allocate codec context" << std::endl;
    return false;
  }

  codec_ctx_->extradata =
      static_cast<uint8_t*>(av_mallocz(avcc.size() + AV_INPUT_BUFFER_PADDING_SIZE));
  if (!codec_ctx_->extradata) {
    CloseCodec();
    return false;
  }
  std::memcpy(codec_ctx_->extradata, avcc.data(), avcc.size());
  codec_ctx_->extradata_size = static_cast<int>(avcc.size());

  const int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    std::cerr << "[H264Decoder] avcodec_open2 failed: " << AvError(ret) << std::endl;
    CloseCodec();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    std::cerr << "[H264Decoder] Failed to allocate frame/packet" << std::endl;
    CloseCodec();
    return false;
  }

  current_params_ = param_sets;
  awaiting_keyframe_ = true;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.codec_opens++;
  }
  std::cout << "[H264Decoder] Codec opened (sps=" << param_sets.sps.size()
            << ", pps=" << param_sets.pps.size() << ", avcC=" << avcc.size() << " bytes)"
            << std::endl;
  return true;
}

void H264Decoder::CloseCodec() {
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  current_params_.reset();
}

bool H264Decoder::Decode(const media::Frame& frame) {
  if (av_new_packet(packet_, static_cast<int>(frame.payload.size())) < 0) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.decode_errors++;
    return false;
  }
  std::memcpy(packet_->data, frame.payload.data(), frame.payload.size());
  if (frame.is_keyframe) {
    packet_->flags |= AV_PKT_FLAG_KEY;
  }

  int ret = avcodec_send_packet(codec_ctx_, packet_);
  av_packet_unref(packet_);
  if (ret < 0) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.decode_errors++;
    return false;
  }

  while (true) {
    ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.decode_errors++;
      return false;
    }

    DecodedPicture picture;
    picture.width = frame_->width;
    picture.height = frame_->height;
    picture.keyframe = frame.is_keyframe;
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      picture.index = stats_.frames_decoded++;
      stats_.width = frame_->width;
      stats_.height = frame_->height;
    }
    av_frame_unref(frame_);
    if (callback_) {
      callback_(picture);
    }
  }
}

}  // namespace mirrorcast::decode
