// Repository: MirrorCast
// Component: Metrics Exporter
// Purpose: Exposes Prometheus metrics at /metrics HTTP endpoint.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/telemetry/MetricsExporter.h"
#include "mirrorcast/telemetry/MetricsHTTPServer.h"

#include <iostream>
#include <sstream>

namespace mirrorcast::telemetry {

namespace {

constexpr size_t kEventQueueCapacity = 256;

constexpr control::PairingPhase kAllPhases[] = {
    control::PairingPhase::kIdle,
    control::PairingPhase::kConnecting,
    control::PairingPhase::kWaitingAcceptance,
    control::PairingPhase::kPaired,
    control::PairingPhase::kFailed,
};

void WriteFamily(std::ostringstream& oss, const char* name, const char* type,
                 const char* help) {
  oss << "# HELP " << name << " " << help << "\n";
  oss << "# TYPE " << name << " " << type << "\n";
}

template <typename T>
void WriteSample(std::ostringstream& oss, const char* name, const char* type,
                 const char* help, T value) {
  WriteFamily(oss, name, type, help);
  oss << name << " " << value << "\n\n";
}

}  // namespace

MetricsExporter::EventQueue::EventQueue(size_t capacity)
    : capacity_(capacity),
      buffer_(capacity),
      head_(0),
      tail_(0) {}

bool MetricsExporter::EventQueue::Push(const Event& event) {
  size_t tail = tail_.load(std::memory_order_relaxed);
  size_t head = head_.load(std::memory_order_acquire);
  size_t next = (tail + 1) % capacity_;
  if (next == head) {
    return false;
  }
  buffer_[tail] = event;
  tail_.store(next, std::memory_order_release);
  return true;
}

bool MetricsExporter::EventQueue::Pop(Event& event) {
  size_t head = head_.load(std::memory_order_relaxed);
  size_t tail = tail_.load(std::memory_order_acquire);
  if (head == tail) {
    return false;
  }
  event = buffer_[head];
  head_.store((head + 1) % capacity_, std::memory_order_release);
  return true;
}

bool MetricsExporter::EventQueue::Empty() const {
  return head_.load(std::memory_order_acquire) ==
         tail_.load(std::memory_order_acquire);
}

MetricsExporter::MetricsExporter(int port, bool enable_http)
    : port_(port),
      enable_http_(enable_http),
      running_(false),
      stop_requested_(false),
      http_server_(enable_http ? std::make_unique<MetricsHTTPServer>(port) : nullptr),
      queue_overflow_total_(0),
      event_queue_(kEventQueueCapacity),
      submitted_events_(0),
      processed_events_(0) {
  if (http_server_) {
    http_server_->SetMetricsCallback([this]() { return this->GenerateMetricsText(); });
  }
}

MetricsExporter::~MetricsExporter() {
  Stop();
}

bool MetricsExporter::Start(bool start_http_server) {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);

  if (enable_http_ && start_http_server && http_server_) {
    if (!http_server_->Start()) {
      std::cerr << "[MetricsExporter] Failed to start HTTP server" << std::endl;
      running_.store(false, std::memory_order_release);
      return false;
    }

    std::cout << "[MetricsExporter] Started HTTP server on port " << port()
              << " - metrics at http://localhost:" << port() << "/metrics" << std::endl;
  }

  worker_thread_ = std::thread(&MetricsExporter::WorkerLoop, this);
  return true;
}

void MetricsExporter::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);
  queue_cv_.notify_all();

  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  if (enable_http_ && http_server_) {
    http_server_->Stop();
  }
}

int MetricsExporter::port() const {
  if (http_server_ && http_server_->IsRunning()) {
    return http_server_->port();
  }
  return port_;
}

bool MetricsExporter::SubmitHostMetrics(const HostMetrics& metrics) {
  Event event{};
  event.type = Event::Type::kUpdateHost;
  event.host = metrics;
  return Submit(event);
}

bool MetricsExporter::SubmitViewerMetrics(const ViewerMetrics& metrics) {
  Event event{};
  event.type = Event::Type::kUpdateViewer;
  event.viewer = metrics;
  return Submit(event);
}

bool MetricsExporter::Submit(const Event& event) {
  if (!running_.load(std::memory_order_acquire)) {
    ProcessEvent(event);
    return true;
  }

  if (!event_queue_.Push(event)) {
    queue_overflow_total_.fetch_add(1, std::memory_order_acq_rel);
    std::cerr << "[MetricsExporter] Queue overflow, snapshot dropped" << std::endl;
    return false;
  }

  submitted_events_.fetch_add(1, std::memory_order_acq_rel);
  queue_cv_.notify_one();
  return true;
}

MetricsExporter::Snapshot MetricsExporter::SnapshotForTest() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  Snapshot snapshot;
  snapshot.host = host_metrics_;
  snapshot.viewer = viewer_metrics_;
  snapshot.queue_overflow_total = queue_overflow_total_.load(std::memory_order_acquire);
  return snapshot;
}

bool MetricsExporter::WaitUntilDrainedForTest(std::chrono::milliseconds timeout) {
  if (!running_.load(std::memory_order_acquire)) {
    return true;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (processed_events_.load(std::memory_order_acquire) >=
            submitted_events_.load(std::memory_order_acquire) &&
        event_queue_.Empty()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

void MetricsExporter::WorkerLoop() {
  while (!stop_requested_.load(std::memory_order_acquire) ||
         !event_queue_.Empty()) {
    Event event;
    if (event_queue_.Pop(event)) {
      ProcessEvent(event);
      processed_events_.fetch_add(1, std::memory_order_acq_rel);
      continue;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, std::chrono::milliseconds(50));
  }
}

void MetricsExporter::ProcessEvent(const Event& event) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  switch (event.type) {
    case Event::Type::kUpdateHost:
      host_metrics_ = event.host;
      break;
    case Event::Type::kUpdateViewer:
      viewer_metrics_ = event.viewer;
      break;
  }
}

std::string MetricsExporter::GenerateMetricsText() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  std::ostringstream oss;

  WriteSample(oss, "mirrorcast_metrics_overflow_total", "counter",
              "Number of dropped metric snapshots due to queue overflow",
              queue_overflow_total_.load(std::memory_order_acquire));

  if (host_metrics_) {
    const HostMetrics& m = *host_metrics_;
    WriteSample(oss, "mirrorcast_host_sessions", "gauge", "Active paired sessions", m.sessions);
    WriteSample(oss, "mirrorcast_host_pending_pairs", "gauge",
                "Handshakes awaiting operator decision", m.pending_pairs);
    WriteSample(oss, "mirrorcast_host_control_connections", "gauge",
                "Open control connections", m.connections);
    WriteSample(oss, "mirrorcast_host_peer_tracked", "gauge",
                "1 when a fresh media peer is tracked", m.peer_tracked ? 1 : 0);
    WriteSample(oss, "mirrorcast_host_broadcast_on", "gauge", "Broadcast flag",
                m.broadcast_on ? 1 : 0);
    WriteSample(oss, "mirrorcast_host_relay_armed", "gauge", "1 while the media relay is armed",
                m.relay_armed ? 1 : 0);
    WriteSample(oss, "mirrorcast_host_frames_sent_total", "counter",
                "Frames fragmented and sent to the media peer", m.frames_sent);
    WriteSample(oss, "mirrorcast_host_frames_unsent_total", "counter",
                "Frames submitted with no fresh media peer", m.frames_unsent);
    WriteSample(oss, "mirrorcast_host_datagrams_sent_total", "counter",
                "Media datagrams sent", m.datagrams_sent);
    WriteSample(oss, "mirrorcast_host_datagrams_forwarded_total", "counter",
                "Pre-packetized datagrams forwarded from the local encoder",
                m.datagrams_forwarded);
    WriteSample(oss, "mirrorcast_host_keepalives_received_total", "counter",
                "Viewer keepalive datagrams received", m.keepalives_received);
    WriteSample(oss, "mirrorcast_host_protocol_errors_total", "counter",
                "Control connections closed for protocol errors", m.protocol_errors);
    WriteSample(oss, "mirrorcast_host_heartbeat_timeouts_total", "counter",
                "Control connections closed for missed heartbeats", m.heartbeat_timeouts);
  }

  if (viewer_metrics_) {
    const ViewerMetrics& m = *viewer_metrics_;
    WriteFamily(oss, "mirrorcast_viewer_pairing_state", "gauge",
                "Current pairing state (1 for the active state)");
    for (control::PairingPhase phase : kAllPhases) {
      oss << "mirrorcast_viewer_pairing_state{state=\"" << control::PhaseToString(phase)
          << "\"} " << (phase == m.pairing_phase ? 1 : 0) << "\n";
    }
    oss << "\n";
    WriteSample(oss, "mirrorcast_viewer_frames_completed_total", "counter",
                "Frames reassembled", m.frames_completed);
    WriteSample(oss, "mirrorcast_viewer_frames_dropped_total", "counter",
                "Partial frames superseded before completion", m.frames_dropped);
    WriteSample(oss, "mirrorcast_viewer_malformed_datagrams_total", "counter",
                "Datagrams rejected by the header codec", m.malformed_datagrams);
    WriteSample(oss, "mirrorcast_viewer_frames_decoded_total", "counter",
                "Pictures produced by the decoder", m.frames_decoded);
    WriteSample(oss, "mirrorcast_viewer_decode_errors_total", "counter",
                "Decoder errors", m.decode_errors);
    WriteSample(oss, "mirrorcast_viewer_fps", "gauge", "Reassembled frames per second", m.fps);
    WriteSample(oss, "mirrorcast_viewer_kbps", "gauge", "Received media kilobits per second",
                m.kbps);
  }

  return oss.str();
}

}  // namespace mirrorcast::telemetry
