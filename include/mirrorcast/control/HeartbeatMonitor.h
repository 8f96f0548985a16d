// Repository: MirrorCast
// Component: Heartbeat Monitor
// Purpose: Control-channel liveness bookkeeping driven by caller timestamps.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_CONTROL_HEARTBEAT_MONITOR_H_
#define MIRRORCAST_CONTROL_HEARTBEAT_MONITOR_H_

#include <cstdint>

namespace mirrorcast::control {

constexpr int64_t kDefaultHeartbeatIntervalUs = 5'000'000;
constexpr int kDefaultHeartbeatMisses = 3;

// HeartbeatMonitor answers two questions for one control connection: is a
// heartbeat due, and has the remote gone silent for too long.
//
// Any inbound control message counts as liveness, not only heartbeats.
// The monitor owns no timer; the connection's ticker feeds it timestamps.
// Not thread-safe; callers guard it together with the connection state.
class HeartbeatMonitor {
 public:
  HeartbeatMonitor(int64_t interval_us = kDefaultHeartbeatIntervalUs,
                   int miss_limit = kDefaultHeartbeatMisses);

  // Marks the connection established at now_utc_us. Liveness and send
  // schedule both start from here.
  void Start(int64_t now_utc_us);

  void OnMessageReceived(int64_t now_utc_us);
  void OnHeartbeatSent(int64_t now_utc_us);

  bool IsHeartbeatDue(int64_t now_utc_us) const;

  // True once nothing has been received for miss_limit whole intervals.
  bool IsExpired(int64_t now_utc_us) const;

  int64_t interval_us() const { return interval_us_; }
  int miss_limit() const { return miss_limit_; }
  int64_t timeout_us() const { return interval_us_ * miss_limit_; }
  int64_t last_received_utc_us() const { return last_received_utc_us_; }
  uint64_t heartbeats_sent() const { return heartbeats_sent_; }
  bool started() const { return started_; }

 private:
  int64_t interval_us_;
  int miss_limit_;
  bool started_;
  int64_t last_received_utc_us_;
  int64_t last_sent_utc_us_;
  uint64_t heartbeats_sent_;
};

}  // namespace mirrorcast::control

#endif  // MIRRORCAST_CONTROL_HEARTBEAT_MONITOR_H_
