// Repository: MirrorCast
// Component: H.264 Decoder Sink
// Purpose: Decodes reassembled AVCC frames with libavcodec.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_DECODE_H264_DECODER_H_
#define MIRRORCAST_DECODE_H264_DECODER_H_

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "mirrorcast/media/Frame.h"

struct AVCodecContext;
struct AVFrame;
struct AVPacket;

namespace mirrorcast::decode {

struct DecoderStats {
  uint64_t frames_received = 0;
  uint64_t frames_decoded = 0;
  uint64_t frames_skipped = 0;  // Waiting for a keyframe with parameter sets
  uint64_t decode_errors = 0;
  uint64_t codec_opens = 0;
  int width = 0;
  int height = 0;
};

struct DecodedPicture {
  int width = 0;
  int height = 0;
  bool keyframe = false;
  uint64_t index = 0;
};

// Builds an ISO/IEC 14496-15 AVCDecoderConfigurationRecord (avcC) with 4-byte
// NAL length fields. Returns empty when there is no usable SPS.
std::vector<uint8_t> BuildAvcDecoderConfig(const media::ParamSets& param_sets);

// H264Decoder is the viewer's FrameSink.
//
// - Opens the codec from the first keyframe that carries parameter sets and
//   reopens whenever the parameter sets change.
// - Frames before that point, and after a decode error until the next
//   keyframe, are skipped.
//
// Thread Model:
// - OnReassembledFrame() is called on the media receive thread only.
// - stats() may be called from any thread.
class H264Decoder : public media::FrameSink {
 public:
  using PictureCallback = std::function<void(const DecodedPicture&)>;

  H264Decoder();
  ~H264Decoder() override;

  H264Decoder(const H264Decoder&) = delete;
  H264Decoder& operator=(const H264Decoder&) = delete;

  void SetPictureCallback(PictureCallback callback);

  void OnReassembledFrame(const media::Frame& frame) override;

  DecoderStats stats() const;

 private:
  bool OpenCodec(const media::ParamSets& param_sets);
  void CloseCodec();
  bool Decode(const media::Frame& frame);

  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVPacket* packet_;

  std::optional<media::ParamSets> current_params_;
  bool awaiting_keyframe_;
  PictureCallback callback_;

  mutable std::mutex stats_mutex_;
  DecoderStats stats_;
};

}  // namespace mirrorcast::decode

#endif  // MIRRORCAST_DECODE_H264_DECODER_H_
