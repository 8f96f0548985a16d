#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "BaseContractTest.h"
#include "mirrorcast/timing/MasterClock.h"
#include "timing/TestMasterClock.h"
#include "../ContractRegistryEnvironment.h"

namespace mirrorcast::tests::contracts {

using mirrorcast::tests::RegisterExpectedDomainCoverage;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("MasterClock", {"MC_001", "MC_002", "MC_003"});
  return true;
}();

class MasterClockContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "MasterClock"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"MC_001", "MC_002", "MC_003"};
  }
};

TEST_F(MasterClockContractTest, MC_001_SystemClockTracksWallTime) {
  auto clock = timing::MakeSystemMasterClock();
  ASSERT_NE(clock, nullptr);

  const auto wall = std::chrono::duration_cast<std::chrono::microseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
  EXPECT_NEAR(static_cast<double>(clock->now_utc_us()), static_cast<double>(wall), 1e6);

  const int64_t first = clock->now_utc_us();
  clock->WaitUntilUtcUs(first + 5'000);
  EXPECT_GE(clock->now_utc_us(), first + 5'000);
}

TEST_F(MasterClockContractTest, MC_002_TestClockMovesOnlyWhenAdvanced) {
  timing::TestMasterClock clock(1'000'000);
  EXPECT_EQ(clock.now_utc_us(), 1'000'000);
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  EXPECT_EQ(clock.now_utc_us(), 1'000'000);

  clock.AdvanceMilliseconds(250);
  EXPECT_EQ(clock.now_utc_us(), 1'250'000);
  clock.AdvanceSeconds(1.5);
  EXPECT_EQ(clock.now_utc_us(), 2'750'000);

  clock.SetNow(5'000'000);
  EXPECT_EQ(clock.now_utc_us(), 5'000'000);
}

TEST_F(MasterClockContractTest, MC_003_TestClockWakesWaitersOnAdvance) {
  timing::TestMasterClock clock(0);
  std::atomic<bool> woke{false};

  std::thread waiter([&] {
    clock.WaitUntilUtcUs(3'000'000);
    woke.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(woke.load());
  clock.AdvanceSeconds(3.0);
  waiter.join();
  EXPECT_TRUE(woke.load());

  // Bounded wait returns even though the target is never reached.
  clock.SetMaxWaitUs(10'000);
  clock.WaitUntilUtcUs(clock.now_utc_us() + 1'000'000);
  EXPECT_EQ(clock.now_utc_us(), 3'000'000);
}

}  // namespace mirrorcast::tests::contracts
