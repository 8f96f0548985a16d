// Repository: MirrorCast
// Component: Master Clock
// Purpose: Injectable time source for liveness, rate windows and frame pacing.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_TIMING_MASTER_CLOCK_H_
#define MIRRORCAST_TIMING_MASTER_CLOCK_H_

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace mirrorcast::timing {

// MasterClock is the only time source the control and media layers consult.
// Heartbeat deadlines, peer freshness and handshake waits are all expressed
// in its microseconds so tests can drive them with a fake clock.
class MasterClock {
 public:
  virtual ~MasterClock() = default;

  // Returns current UTC time in microseconds since Unix epoch.
  virtual int64_t now_utc_us() const = 0;

  // Blocks until the clock reaches or exceeds target_utc_us.
  virtual void WaitUntilUtcUs(int64_t target_utc_us) const {
    while (true) {
      const int64_t now = now_utc_us();
      const int64_t remaining = target_utc_us - now;
      if (remaining <= 0) {
        break;
      }
      const int64_t sleep_us = (remaining > 2'000) ? remaining - 1'000
                                                    : std::max<int64_t>(remaining / 2, 200);
      std::this_thread::sleep_for(std::chrono::microseconds(sleep_us));
    }
  }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock();

}  // namespace mirrorcast::timing

#endif  // MIRRORCAST_TIMING_MASTER_CLOCK_H_
