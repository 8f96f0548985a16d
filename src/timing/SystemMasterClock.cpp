#include "mirrorcast/timing/MasterClock.h"

#include <chrono>
#include <memory>

namespace mirrorcast::timing {

class SystemMasterClock : public MasterClock {
 public:
  int64_t now_utc_us() const override {
    const auto now = std::chrono::system_clock::now();
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
    return micros.count();
  }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock() {
  return std::make_shared<SystemMasterClock>();
}

}  // namespace mirrorcast::timing
