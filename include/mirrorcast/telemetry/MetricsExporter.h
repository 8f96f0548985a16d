// Repository: MirrorCast
// Component: Metrics Exporter
// Purpose: Exposes Prometheus metrics at /metrics HTTP endpoint.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_TELEMETRY_METRICS_EXPORTER_H_
#define MIRRORCAST_TELEMETRY_METRICS_EXPORTER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mirrorcast/control/PairingStateMachine.h"

namespace mirrorcast::telemetry {

class MetricsHTTPServer;

// HostMetrics is one snapshot of the host's control and media plane.
struct HostMetrics {
  uint64_t sessions = 0;
  uint64_t pending_pairs = 0;
  uint64_t connections = 0;
  bool peer_tracked = false;
  bool broadcast_on = false;
  bool relay_armed = false;
  uint64_t frames_sent = 0;
  uint64_t frames_unsent = 0;
  uint64_t datagrams_sent = 0;
  uint64_t datagrams_forwarded = 0;
  uint64_t keepalives_received = 0;
  uint64_t protocol_errors = 0;
  uint64_t heartbeat_timeouts = 0;
};

// ViewerMetrics is one snapshot of the viewer's pairing and receive path.
struct ViewerMetrics {
  control::PairingPhase pairing_phase = control::PairingPhase::kIdle;
  uint64_t frames_completed = 0;
  uint64_t frames_dropped = 0;
  uint64_t malformed_datagrams = 0;
  uint64_t frames_decoded = 0;
  uint64_t decode_errors = 0;
  double fps = 0.0;
  double kbps = 0.0;
};

// MetricsExporter serves Prometheus metrics at an HTTP endpoint.
//
// Producers submit snapshots without blocking; a worker thread drains a
// bounded single-producer queue into the published state. Submissions made
// while the exporter is stopped are applied synchronously.
//
// Metrics Exported:
// - mirrorcast_host_sessions, mirrorcast_host_pending_pairs - gauge
// - mirrorcast_host_peer_tracked, mirrorcast_host_broadcast_on - gauge
// - mirrorcast_host_frames_sent_total, ..._frames_unsent_total - counter
// - mirrorcast_host_datagrams_sent_total - counter
// - mirrorcast_viewer_pairing_state{state="..."} - gauge
// - mirrorcast_viewer_frames_completed_total, ..._frames_dropped_total - counter
// - mirrorcast_viewer_malformed_datagrams_total - counter
// - mirrorcast_viewer_fps, mirrorcast_viewer_kbps - gauge
class MetricsExporter {
 public:
  struct Snapshot {
    std::optional<HostMetrics> host;
    std::optional<ViewerMetrics> viewer;
    uint64_t queue_overflow_total = 0;
  };

  // Port 0 lets the HTTP server bind an ephemeral port.
  explicit MetricsExporter(int port = 9308, bool enable_http = true);

  ~MetricsExporter();

  MetricsExporter(const MetricsExporter&) = delete;
  MetricsExporter& operator=(const MetricsExporter&) = delete;

  bool Start(bool start_http_server = true);
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound HTTP port, or the configured one before Start().
  int port() const;

  // Returns false when the queue is full; the sample is dropped.
  bool SubmitHostMetrics(const HostMetrics& metrics);
  bool SubmitViewerMetrics(const ViewerMetrics& metrics);

  // Generates Prometheus-format metrics text.
  std::string GenerateMetricsText() const;

  // Test helpers.
  Snapshot SnapshotForTest() const;
  bool WaitUntilDrainedForTest(std::chrono::milliseconds timeout);

  uint64_t queue_overflow_total() const {
    return queue_overflow_total_.load(std::memory_order_acquire);
  }

 private:
  struct Event {
    enum class Type {
      kUpdateHost,
      kUpdateViewer,
    };

    Type type = Type::kUpdateHost;
    HostMetrics host;
    ViewerMetrics viewer;
  };

  class EventQueue {
   public:
    explicit EventQueue(size_t capacity);

    bool Push(const Event& event);
    bool Pop(Event& event);
    bool Empty() const;

   private:
    const size_t capacity_;
    std::vector<Event> buffer_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
  };

  bool Submit(const Event& event);
  void WorkerLoop();
  void ProcessEvent(const Event& event);

  int port_;
  const bool enable_http_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;

  std::unique_ptr<MetricsHTTPServer> http_server_;

  std::atomic<uint64_t> queue_overflow_total_;
  EventQueue event_queue_;
  std::atomic<uint64_t> submitted_events_;
  std::atomic<uint64_t> processed_events_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::thread worker_thread_;

  mutable std::mutex metrics_mutex_;
  std::optional<HostMetrics> host_metrics_;
  std::optional<ViewerMetrics> viewer_metrics_;
};

}  // namespace mirrorcast::telemetry

#endif  // MIRRORCAST_TELEMETRY_METRICS_EXPORTER_H_
