// Repository: MirrorCast
// Component: Host Runtime
// Purpose: Wires the control server, media relay and broadcast flag into one host.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/runtime/HostRuntime.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace mirrorcast::runtime {

namespace {

constexpr int64_t kMaxSupervisorTickMs = 250;

}  // namespace

HostRuntime::HostRuntime(const MirrorConfig& config,
                         std::shared_ptr<timing::MasterClock> clock,
                         std::unique_ptr<BroadcastFlag> broadcast_flag,
                         std::shared_ptr<telemetry::MetricsExporter> metrics)
    : config_(config),
      clock_(std::move(clock)),
      broadcast_flag_(std::move(broadcast_flag)),
      metrics_(std::move(metrics)),
      control_server_(config.control, clock_, broadcast_flag_.get()),
      relay_(config.media, clock_),
      running_(false),
      stop_requested_(false) {}

HostRuntime::~HostRuntime() { Stop(); }

bool HostRuntime::Start() {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[HostRuntime] Already running" << std::endl;
    return false;
  }

  if (!relay_.Start()) {
    return false;
  }
  if (!control_server_.Start()) {
    relay_.Stop();
    return false;
  }
  control_server_.SetMediaPort(relay_.port());

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  ReconcileNow();

  if (config_.test_stream) {
    media::TestPatternConfig pattern;
    pattern.fps = std::max(1, config_.test_stream_fps);
    pattern.keyframe_interval = pattern.fps;
    test_pattern_ = std::make_unique<media::TestPatternSource>(pattern, clock_);
    test_pattern_->Start([this](const media::Frame& frame) { relay_.SubmitFrame(frame); });
  }

  supervisor_thread_ = std::make_unique<std::thread>(&HostRuntime::SupervisorLoop, this);

  std::cout << "[HostRuntime] Control port " << control_server_.port() << ", media port "
            << relay_.port() << std::endl;
  return true;
}

void HostRuntime::Stop() {
  if (!running_.load(std::memory_order_acquire) && !supervisor_thread_) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(supervisor_mutex_);
    supervisor_cv_.notify_all();
  }
  if (supervisor_thread_ && supervisor_thread_->joinable()) {
    supervisor_thread_->join();
  }
  supervisor_thread_.reset();

  if (test_pattern_) {
    test_pattern_->Stop();
    test_pattern_.reset();
  }
  control_server_.Stop();
  relay_.Stop();
  running_.store(false, std::memory_order_release);
  std::cout << "[HostRuntime] Stopped" << std::endl;
}

void HostRuntime::SetBroadcastOn(bool on) {
  broadcast_flag_->SetBroadcastOn(on);
  ReconcileNow();
}

void HostRuntime::ReconcileNow() {
  {
    std::lock_guard<std::mutex> lock(reconcile_mutex_);
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    if (broadcast_flag_->IsBroadcastOn()) {
      relay_.Arm();
    } else {
      relay_.Disarm();
    }
  }

  if (metrics_) {
    metrics_->SubmitHostMetrics(CollectMetrics());
  }
}

telemetry::HostMetrics HostRuntime::CollectMetrics() const {
  telemetry::HostMetrics metrics;
  const auto& registry = control_server_.registry();
  metrics.sessions = registry.Sessions().size();
  metrics.pending_pairs = registry.PendingPairs().size();
  metrics.connections = control_server_.connection_count();

  const auto control_stats = control_server_.stats();
  metrics.protocol_errors = control_stats.protocol_errors;
  metrics.heartbeat_timeouts = control_stats.heartbeat_timeouts;

  const auto relay_stats = relay_.stats();
  metrics.peer_tracked = relay_.ActivePeer().has_value();
  metrics.relay_armed = relay_.armed();
  metrics.broadcast_on = broadcast_flag_->IsBroadcastOn();
  metrics.frames_sent = relay_stats.frames_sent;
  metrics.frames_unsent = relay_stats.frames_unsent;
  metrics.datagrams_sent = relay_stats.datagrams_sent;
  metrics.datagrams_forwarded = relay_stats.datagrams_forwarded;
  metrics.keepalives_received = relay_stats.keepalives_received;
  return metrics;
}

void HostRuntime::SupervisorLoop() {
  const auto tick = std::chrono::milliseconds(
      std::clamp<int64_t>(config_.control.broadcast_poll_ms, 10, kMaxSupervisorTickMs));
  std::unique_lock<std::mutex> lock(supervisor_mutex_);
  while (!stop_requested_.load(std::memory_order_acquire)) {
    supervisor_cv_.wait_for(lock, tick, [this] {
      return stop_requested_.load(std::memory_order_acquire);
    });
    if (stop_requested_.load(std::memory_order_acquire)) {
      break;
    }
    lock.unlock();
    ReconcileNow();
    lock.lock();
  }
}

}  // namespace mirrorcast::runtime
