// Repository: MirrorCast
// Component: Metrics HTTP Server
// Purpose: Minimal HTTP server for the Prometheus metrics endpoint.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/telemetry/MetricsHTTPServer.h"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <sstream>

#include "mirrorcast/net/SocketUtil.h"

namespace mirrorcast::telemetry {

namespace {

constexpr int kAcceptPollMs = 100;
constexpr int64_t kRequestTimeoutMs = 5'000;

std::string PlainResponse(const std::string& status, const std::string& content_type,
                          const std::string& body) {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << "\r\n";
  response << "Content-Type: " << content_type << "\r\n";
  response << "Content-Length: " << body.length() << "\r\n";
  response << "Connection: close\r\n";
  response << "\r\n";
  response << body;
  return response.str();
}

}  // namespace

MetricsHTTPServer::MetricsHTTPServer(int port)
    : port_(port),
      running_(false),
      stop_requested_(false),
      server_socket_(net::kInvalidSocket) {}

MetricsHTTPServer::~MetricsHTTPServer() { Stop(); }

void MetricsHTTPServer::SetMetricsCallback(MetricsCallback callback) {
  metrics_callback_ = std::move(callback);
}

bool MetricsHTTPServer::Start() {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[MetricsHTTPServer] Already running" << std::endl;
    return false;
  }
  if (!metrics_callback_) {
    std::cerr << "[MetricsHTTPServer] Metrics callback not set" << std::endl;
    return false;
  }

  uint16_t bound = 0;
  server_socket_ = net::OpenTcpListener("0.0.0.0", static_cast<uint16_t>(port_), &bound);
  if (server_socket_ == net::kInvalidSocket) {
    std::cerr << "[MetricsHTTPServer] Failed to bind port " << port_ << std::endl;
    return false;
  }
  port_ = bound;

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  server_thread_ = std::make_unique<std::thread>(&MetricsHTTPServer::ServerLoop, this);

  std::cout << "[MetricsHTTPServer] Listening on port " << port_ << std::endl;
  return true;
}

void MetricsHTTPServer::Stop() {
  if (!running_.load(std::memory_order_acquire) && !server_thread_) {
    return;
  }

  std::cout << "[MetricsHTTPServer] Stopping..." << std::endl;
  stop_requested_.store(true, std::memory_order_release);
  if (server_thread_ && server_thread_->joinable()) {
    server_thread_->join();
  }
  server_thread_.reset();
  net::CloseSocket(server_socket_);
  running_.store(false, std::memory_order_release);
  std::cout << "[MetricsHTTPServer] Stopped" << std::endl;
}

void MetricsHTTPServer::ServerLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    pollfd pfd{};
    pfd.fd = server_socket_;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, kAcceptPollMs);
    if (ready < 0 && errno != EINTR) {
      break;
    }
    if (ready <= 0) {
      continue;
    }

    const int client_socket = accept(server_socket_, nullptr, nullptr);
    if (client_socket < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      // Real error or server closing
      break;
    }

    HandleConnection(client_socket);
    close(client_socket);
  }
}

void MetricsHTTPServer::HandleConnection(int client_socket) {
  net::SetReceiveTimeout(client_socket, kRequestTimeoutMs);

  char buffer[4096] = {0};
  const ssize_t bytes_read = recv(client_socket, buffer, sizeof(buffer) - 1, 0);
  if (bytes_read <= 0) {
    return;
  }
  buffer[bytes_read] = '\0';

  const std::string response = GenerateResponse(ParseRequestPath(buffer));
  if (!net::SendAll(client_socket, response.data(), response.size())) {
    std::cerr << "[MetricsHTTPServer] Failed to send response" << std::endl;
  }
}

std::string MetricsHTTPServer::ParseRequestPath(const std::string& request) {
  // GET /path HTTP/1.1
  const size_t space1 = request.find(' ');
  if (space1 == std::string::npos) {
    return "/";
  }
  const size_t space2 = request.find(' ', space1 + 1);
  if (space2 == std::string::npos) {
    return "/";
  }
  return request.substr(space1 + 1, space2 - space1 - 1);
}

std::string MetricsHTTPServer::GenerateResponse(const std::string& path) const {
  if (path == "/metrics") {
    return PlainResponse("200 OK", "text/plain; version=0.0.4; charset=utf-8",
                         metrics_callback_ ? metrics_callback_() : std::string());
  }
  if (path == "/") {
    return PlainResponse("200 OK", "text/plain",
                         "MirrorCast - Metrics Server\nMetrics available at: /metrics\n");
  }
  return PlainResponse("404 Not Found", "text/plain", "404 Not Found\n");
}

}  // namespace mirrorcast::telemetry
