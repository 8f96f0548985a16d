// Repository: MirrorCast
// Component: Heartbeat Monitor
// Purpose: Control-channel liveness bookkeeping driven by caller timestamps.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/control/HeartbeatMonitor.h"

namespace mirrorcast::control {

HeartbeatMonitor::HeartbeatMonitor(int64_t interval_us, int miss_limit)
    : interval_us_(interval_us > 0 ? interval_us : kDefaultHeartbeatIntervalUs),
      miss_limit_(miss_limit > 0 ? miss_limit : kDefaultHeartbeatMisses),
      started_(false),
      last_received_utc_us_(0),
      last_sent_utc_us_(0),
      heartbeats_sent_(0) {}

void HeartbeatMonitor::Start(int64_t now_utc_us) {
  started_ = true;
  last_received_utc_us_ = now_utc_us;
  last_sent_utc_us_ = now_utc_us;
}

void HeartbeatMonitor::OnMessageReceived(int64_t now_utc_us) {
  if (now_utc_us > last_received_utc_us_) {
    last_received_utc_us_ = now_utc_us;
  }
}

void HeartbeatMonitor::OnHeartbeatSent(int64_t now_utc_us) {
  last_sent_utc_us_ = now_utc_us;
  ++heartbeats_sent_;
}

bool HeartbeatMonitor::IsHeartbeatDue(int64_t now_utc_us) const {
  return started_ && now_utc_us - last_sent_utc_us_ >= interval_us_;
}

bool HeartbeatMonitor::IsExpired(int64_t now_utc_us) const {
  return started_ && now_utc_us - last_received_utc_us_ >= timeout_us();
}

}  // namespace mirrorcast::control
