// Repository: MirrorCast
// Component: Test Pattern Source
// Purpose: Synthetic encoder feed for exercising the host media path.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/media/TestPatternSource.h"

#include <iostream>
#include <utility>

namespace mirrorcast::media {

namespace {

constexpr uint8_t kNalIdr = 0x65;
constexpr uint8_t kNalNonIdr = 0x41;

void AppendNal(std::vector<uint8_t>& out, uint8_t nal_header, std::size_t body_bytes,
               uint64_t seed) {
  const uint32_t length = static_cast<uint32_t>(body_bytes + 1);
  out.push_back(static_cast<uint8_t>(length >> 24));
  out.push_back(static_cast<uint8_t>(length >> 16));
  out.push_back(static_cast<uint8_t>(length >> 8));
  out.push_back(static_cast<uint8_t>(length));
  out.push_back(nal_header);
  for (std::size_t i = 0; i < body_bytes; ++i) {
    out.push_back(static_cast<uint8_t>((seed + i) & 0xFF));
  }
}

}  // namespace

TestPatternSource::TestPatternSource(const TestPatternConfig& config,
                                     std::shared_ptr<timing::MasterClock> clock)
    : config_(config),
      clock_(clock ? std::move(clock) : timing::MakeSystemMasterClock()),
      running_(false),
      stop_requested_(false),
      frames_emitted_(0) {}

TestPatternSource::~TestPatternSource() { Stop(); }

ParamSets TestPatternSource::SyntheticParamSets(int width, int height) {
  ParamSets sets;
  // Baseline profile, level 3.1; trailing bytes carry the geometry.
  sets.sps.push_back({0x67, 0x42, 0xC0, 0x1F,
                      static_cast<uint8_t>(width >> 8), static_cast<uint8_t>(width),
                      static_cast<uint8_t>(height >> 8), static_cast<uint8_t>(height)});
  sets.pps.push_back({0x68, 0xCE, 0x3C, 0x80});
  return sets;
}

Frame TestPatternSource::MakeFrame(uint64_t index) const {
  const int interval = config_.keyframe_interval > 0 ? config_.keyframe_interval : 1;
  Frame frame;
  frame.is_keyframe = index % static_cast<uint64_t>(interval) == 0;
  frame.width = config_.width;
  frame.height = config_.height;
  if (frame.is_keyframe) {
    frame.param_sets = SyntheticParamSets(config_.width, config_.height);
    AppendNal(frame.payload, kNalIdr, config_.keyframe_bytes, index);
  } else {
    AppendNal(frame.payload, kNalNonIdr, config_.delta_bytes, index);
  }
  return frame;
}

bool TestPatternSource::Start(FrameCallback callback) {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[TestPatternSource] Already running" << std::endl;
    return false;
  }
  if (!callback || config_.fps <= 0) {
    std::cerr << "[TestPatternSource] Invalid configuration" << std::endl;
    return false;
  }
  callback_ = std::move(callback);
  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  thread_ = std::make_unique<std::thread>(&TestPatternSource::Run, this);
  std::cout << "[TestPatternSource] Started " << config_.width << "x" << config_.height
            << " @ " << config_.fps << " fps" << std::endl;
  return true;
}

void TestPatternSource::Stop() {
  if (!thread_) {
    return;
  }
  stop_requested_.store(true, std::memory_order_release);
  if (thread_->joinable()) {
    thread_->join();
  }
  thread_.reset();
  running_.store(false, std::memory_order_release);
  std::cout << "[TestPatternSource] Stopped after " << frames_emitted_.load() << " frames"
            << std::endl;
}

void TestPatternSource::Run() {
  const int64_t period_us = 1'000'000 / config_.fps;
  int64_t next_utc_us = clock_->now_utc_us();
  uint64_t index = 0;

  while (!stop_requested_.load(std::memory_order_acquire)) {
    callback_(MakeFrame(index++));
    frames_emitted_.fetch_add(1);

    next_utc_us += period_us;
    // A bounded wait may return early; keep waiting until the slot or a stop.
    while (!stop_requested_.load(std::memory_order_acquire) &&
           clock_->now_utc_us() < next_utc_us) {
      clock_->WaitUntilUtcUs(next_utc_us);
    }
  }
}

}  // namespace mirrorcast::media
