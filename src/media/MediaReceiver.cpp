// Repository: MirrorCast
// Component: Media Receiver
// Purpose: Viewer UDP endpoint: keepalives out, reassembled frames to the sink.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/media/MediaReceiver.h"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>
#include <vector>

#include "mirrorcast/net/SocketUtil.h"

namespace mirrorcast::media {

namespace {

constexpr int64_t kReceiveTimeoutMs = 200;
constexpr std::size_t kMaxDatagramBytes = 65536;

}  // namespace

MediaReceiver::MediaReceiver(const runtime::MediaConfig& config,
                             std::shared_ptr<timing::MasterClock> clock,
                             FrameSink* sink)
    : config_(config),
      clock_(std::move(clock)),
      sink_(sink),
      running_(false),
      stop_requested_(false),
      socket_(net::kInvalidSocket),
      keepalives_sent_(0) {}

MediaReceiver::~MediaReceiver() { Stop(); }

bool MediaReceiver::Start(const std::string& host, uint16_t port) {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[MediaReceiver] Already running" << std::endl;
    return false;
  }

  sockaddr_in remote{};
  if (!net::ResolveIPv4(host, port, &remote)) {
    std::cerr << "[MediaReceiver] Cannot resolve " << host << std::endl;
    return false;
  }
  socket_ = net::OpenUdpSocket("0.0.0.0", 0, nullptr);
  if (socket_ == net::kInvalidSocket) {
    return false;
  }
  if (connect(socket_, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) < 0) {
    std::cerr << "[MediaReceiver] connect failed: " << std::strerror(errno) << std::endl;
    net::CloseSocket(socket_);
    return false;
  }
  net::SetReceiveTimeout(socket_, kReceiveTimeoutMs);
  target_ = net::FormatEndpoint(remote);

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);

  if (!SendKeepalive()) {
    std::cerr << "[MediaReceiver] Hello to " << target_ << " failed" << std::endl;
  }
  receive_thread_ = std::make_unique<std::thread>(&MediaReceiver::ReceiveLoop, this);
  keepalive_thread_ = std::make_unique<std::thread>(&MediaReceiver::KeepaliveLoop, this);

  std::cout << "[MediaReceiver] Receiving from " << target_ << std::endl;
  return true;
}

void MediaReceiver::Stop() {
  if (!running_.load(std::memory_order_acquire) && !receive_thread_ && !keepalive_thread_) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(keepalive_mutex_);
    keepalive_cv_.notify_all();
  }
  if (receive_thread_ && receive_thread_->joinable()) {
    receive_thread_->join();
  }
  receive_thread_.reset();
  if (keepalive_thread_ && keepalive_thread_->joinable()) {
    keepalive_thread_->join();
  }
  keepalive_thread_.reset();

  // Partial frame is dropped, never delivered.
  reassembler_.Reset();
  PublishStats();

  net::CloseSocket(socket_);
  running_.store(false, std::memory_order_release);
  std::cout << "[MediaReceiver] Stopped" << std::endl;
}

std::string MediaReceiver::target() const { return target_; }

ReassemblerStats MediaReceiver::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void MediaReceiver::ReceiveLoop() {
  std::vector<uint8_t> buffer(kMaxDatagramBytes);

  while (!stop_requested_.load(std::memory_order_acquire)) {
    const ssize_t n = recv(socket_, buffer.data(), buffer.size(), 0);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
          errno == ECONNREFUSED) {
        // ECONNREFUSED: ICMP for a keepalive sent before the host bound.
        continue;
      }
      std::cerr << "[MediaReceiver] recv failed: " << std::strerror(errno) << std::endl;
      break;
    }

    auto frame = reassembler_.Ingest(buffer.data(), static_cast<std::size_t>(n),
                                     clock_->now_utc_us());
    PublishStats();
    if (frame && sink_ != nullptr) {
      sink_->OnReassembledFrame(*frame);
    }
  }
}

void MediaReceiver::KeepaliveLoop() {
  const auto interval = std::chrono::milliseconds(config_.keepalive_interval_ms);
  std::unique_lock<std::mutex> lock(keepalive_mutex_);
  while (!stop_requested_.load(std::memory_order_acquire)) {
    keepalive_cv_.wait_for(lock, interval, [this] {
      return stop_requested_.load(std::memory_order_acquire);
    });
    if (stop_requested_.load(std::memory_order_acquire)) {
      break;
    }
    SendKeepalive();
  }
}

bool MediaReceiver::SendKeepalive() {
  const ssize_t sent = send(socket_, kKeepalivePayload, sizeof(kKeepalivePayload) - 1, 0);
  if (sent < 0) {
    return false;
  }
  keepalives_sent_.fetch_add(1);
  return true;
}

void MediaReceiver::PublishStats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_ = reassembler_.stats();
}

}  // namespace mirrorcast::media
