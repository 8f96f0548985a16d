#ifndef MIRRORCAST_TIMING_TEST_MASTER_CLOCK_H_
#define MIRRORCAST_TIMING_TEST_MASTER_CLOCK_H_

#include "mirrorcast/timing/MasterClock.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace mirrorcast::timing {

// TestMasterClock only moves when told to. Heartbeat expiry, peer staleness
// and handshake deadlines can then be crossed in a single call.
class TestMasterClock : public MasterClock {
 public:
  explicit TestMasterClock(int64_t start_time_us = 1'700'000'000'000'000);

  int64_t now_utc_us() const override;
  void WaitUntilUtcUs(int64_t target_utc_us) const override;

  void SetNow(int64_t utc_us);
  void AdvanceMicroseconds(int64_t delta_us);
  void AdvanceMilliseconds(int64_t delta_ms) { AdvanceMicroseconds(delta_ms * 1'000); }
  void AdvanceSeconds(double delta_s);

  // Bounds each WaitUntilUtcUs call in real time, so a waiter that loops on
  // the clock can still observe its stop flag. 0 waits indefinitely.
  void SetMaxWaitUs(int64_t max_wait_us);

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<int64_t> utc_us_;
  int64_t max_wait_us_;  // Protected by mutex_
};

}  // namespace mirrorcast::timing

#endif  // MIRRORCAST_TIMING_TEST_MASTER_CLOCK_H_
