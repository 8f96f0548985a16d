// Repository: MirrorCast
// Component: Test Pattern Source
// Purpose: Synthetic encoder feed for exercising the host media path.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_MEDIA_TEST_PATTERN_SOURCE_H_
#define MIRRORCAST_MEDIA_TEST_PATTERN_SOURCE_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "mirrorcast/media/Frame.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::media {

struct TestPatternConfig {
  int width = 1280;
  int height = 720;
  int fps = 30;
  int keyframe_interval = 30;  // Frames between keyframes
  std::size_t keyframe_bytes = 6000;
  std::size_t delta_bytes = 1500;
};

// TestPatternSource stands in for the hardware encoder. Frames are AVCC
// shaped (4-byte length prefixed NAL units) and every keyframe carries a
// parameter set, but the slice bytes are a counter pattern, not real H.264.
//
// Frames are paced on the MasterClock. Stop() returns once the pacing wait
// does, so a fake clock must be advanced or have its waits bounded.
class TestPatternSource {
 public:
  using FrameCallback = std::function<void(const Frame&)>;

  // A null clock paces on the system clock.
  explicit TestPatternSource(const TestPatternConfig& config = TestPatternConfig{},
                             std::shared_ptr<timing::MasterClock> clock = nullptr);
  ~TestPatternSource();

  TestPatternSource(const TestPatternSource&) = delete;
  TestPatternSource& operator=(const TestPatternSource&) = delete;

  // Builds frame number `index` without starting the thread.
  Frame MakeFrame(uint64_t index) const;

  bool Start(FrameCallback callback);
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  uint64_t frames_emitted() const { return frames_emitted_.load(); }

  static ParamSets SyntheticParamSets(int width, int height);

 private:
  void Run();

  const TestPatternConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  FrameCallback callback_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  std::atomic<uint64_t> frames_emitted_;
  std::unique_ptr<std::thread> thread_;
};

}  // namespace mirrorcast::media

#endif  // MIRRORCAST_MEDIA_TEST_PATTERN_SOURCE_H_
