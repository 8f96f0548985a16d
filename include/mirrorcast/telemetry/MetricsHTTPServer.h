// Repository: MirrorCast
// Component: Metrics HTTP Server
// Purpose: Minimal HTTP server for the Prometheus metrics endpoint.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_TELEMETRY_METRICS_HTTP_SERVER_H_
#define MIRRORCAST_TELEMETRY_METRICS_HTTP_SERVER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace mirrorcast::telemetry {

// MetricsCallback is called to generate metrics text for each request.
using MetricsCallback = std::function<std::string()>;

// MetricsHTTPServer serves Prometheus metrics over HTTP.
//
// - GET /metrics returns the callback's text (text/plain; version=0.0.4)
// - GET / returns a short banner, anything else 404
// - One request per connection; the callback runs on the server thread
class MetricsHTTPServer {
 public:
  // Port 0 binds an ephemeral port; see port() after Start().
  explicit MetricsHTTPServer(int port = 9308);

  ~MetricsHTTPServer();

  MetricsHTTPServer(const MetricsHTTPServer&) = delete;
  MetricsHTTPServer& operator=(const MetricsHTTPServer&) = delete;

  // Must be called before Start().
  void SetMetricsCallback(MetricsCallback callback);

  // Binds synchronously, then serves on a dedicated thread.
  bool Start();
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  int port() const { return port_; }

  // Exposed for tests.
  static std::string ParseRequestPath(const std::string& request);
  std::string GenerateResponse(const std::string& path) const;

 private:
  void ServerLoop();
  void HandleConnection(int client_socket);

  int port_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;

  std::unique_ptr<std::thread> server_thread_;
  MetricsCallback metrics_callback_;

  int server_socket_;
};

}  // namespace mirrorcast::telemetry

#endif  // MIRRORCAST_TELEMETRY_METRICS_HTTP_SERVER_H_
