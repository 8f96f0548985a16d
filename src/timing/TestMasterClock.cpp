#include "timing/TestMasterClock.h"

#include <chrono>
#include <cmath>

namespace mirrorcast::timing {

namespace {
constexpr double kMillion = 1'000'000.0;
}

TestMasterClock::TestMasterClock(int64_t start_time_us)
    : utc_us_(start_time_us),
      max_wait_us_(0) {}

int64_t TestMasterClock::now_utc_us() const {
  return utc_us_.load(std::memory_order_acquire);
}

void TestMasterClock::WaitUntilUtcUs(int64_t target_utc_us) const {
  std::unique_lock<std::mutex> lock(mutex_);
  const auto reached = [&] { return utc_us_.load(std::memory_order_acquire) >= target_utc_us; };
  if (max_wait_us_ > 0) {
    cv_.wait_for(lock, std::chrono::microseconds(max_wait_us_), reached);
  } else {
    cv_.wait(lock, reached);
  }
}

void TestMasterClock::SetNow(int64_t utc_us) {
  std::lock_guard<std::mutex> lock(mutex_);
  utc_us_.store(utc_us, std::memory_order_release);
  cv_.notify_all();
}

void TestMasterClock::AdvanceMicroseconds(int64_t delta_us) {
  std::lock_guard<std::mutex> lock(mutex_);
  utc_us_.fetch_add(delta_us, std::memory_order_acq_rel);
  cv_.notify_all();
}

void TestMasterClock::AdvanceSeconds(double delta_s) {
  AdvanceMicroseconds(static_cast<int64_t>(std::llround(delta_s * kMillion)));
}

void TestMasterClock::SetMaxWaitUs(int64_t max_wait_us) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_wait_us_ = max_wait_us;
}

}  // namespace mirrorcast::timing
