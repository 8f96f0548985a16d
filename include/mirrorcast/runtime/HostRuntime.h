// Repository: MirrorCast
// Component: Host Runtime
// Purpose: Wires the control server, media relay and broadcast flag into one host.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_RUNTIME_HOST_RUNTIME_H_
#define MIRRORCAST_RUNTIME_HOST_RUNTIME_H_

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "mirrorcast/control/ControlServer.h"
#include "mirrorcast/media/MediaRelay.h"
#include "mirrorcast/media/TestPatternSource.h"
#include "mirrorcast/runtime/BroadcastFlag.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/telemetry/MetricsExporter.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::runtime {

// HostRuntime owns everything the accepting device runs.
//
// Lifecycle:
// - Start() binds the media relay first so its port is known before any
//   viewer pairs, then starts the control server and the supervisor.
// - The supervisor arms the relay while the broadcast flag is on, disarms it
//   otherwise, and publishes host metrics.
// - With test_stream enabled a TestPatternSource feeds the relay.
class HostRuntime {
 public:
  HostRuntime(const MirrorConfig& config,
              std::shared_ptr<timing::MasterClock> clock,
              std::unique_ptr<BroadcastFlag> broadcast_flag,
              std::shared_ptr<telemetry::MetricsExporter> metrics = nullptr);
  ~HostRuntime();

  HostRuntime(const HostRuntime&) = delete;
  HostRuntime& operator=(const HostRuntime&) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  control::ControlServer& control_server() { return control_server_; }
  media::MediaRelay& relay() { return relay_; }
  BroadcastFlag& broadcast_flag() { return *broadcast_flag_; }

  // Sets the flag and applies it to the relay without waiting for a tick.
  void SetBroadcastOn(bool on);

  // Applies the broadcast flag to the relay and publishes metrics.
  void ReconcileNow();

  telemetry::HostMetrics CollectMetrics() const;

 private:
  void SupervisorLoop();

  const MirrorConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  std::unique_ptr<BroadcastFlag> broadcast_flag_;
  std::shared_ptr<telemetry::MetricsExporter> metrics_;

  control::ControlServer control_server_;
  media::MediaRelay relay_;
  std::unique_ptr<media::TestPatternSource> test_pattern_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  std::mutex reconcile_mutex_;
  std::unique_ptr<std::thread> supervisor_thread_;
  std::mutex supervisor_mutex_;
  std::condition_variable supervisor_cv_;
};

}  // namespace mirrorcast::runtime

#endif  // MIRRORCAST_RUNTIME_HOST_RUNTIME_H_
