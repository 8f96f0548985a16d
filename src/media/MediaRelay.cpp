// Repository: MirrorCast
// Component: Media Relay
// Purpose: Host UDP endpoint that sends fragmented frames to the freshest viewer.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/media/MediaRelay.h"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#include "mirrorcast/common/ErrorKind.h"
#include "mirrorcast/net/SocketUtil.h"
#include "mirrorcast/wire/WireHeader.h"

namespace mirrorcast::media {

namespace {

constexpr int64_t kReceiveTimeoutMs = 200;
constexpr std::size_t kMaxDatagramBytes = 65536;

}  // namespace

MediaRelay::MediaRelay(const runtime::MediaConfig& config,
                       std::shared_ptr<timing::MasterClock> clock)
    : config_(config),
      clock_(std::move(clock)),
      fragmenter_(config.mtu),
      running_(false),
      stop_requested_(false),
      armed_(false),
      socket_(net::kInvalidSocket),
      bound_port_(0),
      tracker_(config.freshness_ms * 1'000),
      seq_(0) {}

MediaRelay::~MediaRelay() { Stop(); }

bool MediaRelay::Start() {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[MediaRelay] Already running" << std::endl;
    return false;
  }

  socket_ = net::OpenUdpSocket(config_.bind_host, config_.relay_port, &bound_port_);
  if (socket_ == net::kInvalidSocket) {
    std::cerr << "[MediaRelay] Failed to bind UDP port " << config_.relay_port << std::endl;
    return false;
  }
  net::SetReceiveTimeout(socket_, kReceiveTimeoutMs);

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  receive_thread_ = std::make_unique<std::thread>(&MediaRelay::ReceiveLoop, this);
  sweep_thread_ = std::make_unique<std::thread>(&MediaRelay::SweepLoop, this);

  std::cout << "[MediaRelay] Listening on UDP port " << bound_port_ << " (mtu="
            << config_.mtu << ")" << std::endl;
  return true;
}

void MediaRelay::Stop() {
  if (!running_.load(std::memory_order_acquire) && !receive_thread_ && !sweep_thread_) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    sweep_cv_.notify_all();
  }
  if (receive_thread_ && receive_thread_->joinable()) {
    receive_thread_->join();
  }
  receive_thread_.reset();
  if (sweep_thread_ && sweep_thread_->joinable()) {
    sweep_thread_->join();
  }
  sweep_thread_.reset();

  Disarm();
  net::CloseSocket(socket_);
  running_.store(false, std::memory_order_release);
  std::cout << "[MediaRelay] Stopped" << std::endl;
}

void MediaRelay::Arm() {
  if (!armed_.exchange(true, std::memory_order_acq_rel)) {
    std::cout << "[MediaRelay] Armed" << std::endl;
  }
}

void MediaRelay::Disarm() {
  std::lock_guard<std::mutex> lock(media_mutex_);
  if (armed_.exchange(false, std::memory_order_acq_rel)) {
    std::cout << "[MediaRelay] Disarmed" << std::endl;
  }
  tracker_.Clear();
}

bool MediaRelay::SubmitFrame(const Frame& frame) {
  std::lock_guard<std::mutex> lock(media_mutex_);
  if (!armed_.load(std::memory_order_acquire)) {
    ++stats_.frames_unsent;
    return false;
  }
  const auto peer = tracker_.ActivePeer(clock_->now_utc_us());
  if (!peer) {
    ++stats_.frames_unsent;
    return false;
  }

  const auto datagrams = fragmenter_.Fragment(frame, seq_);
  if (datagrams.empty()) {
    if (++stats_.frames_rejected == 1) {
      std::cerr << "[MediaRelay] " << ErrorKindToString(ErrorKind::kConfiguration)
                << ": mtu " << config_.mtu << " cannot carry the frame header" << std::endl;
    }
    return false;
  }
  bool all_sent = true;
  for (const auto& datagram : datagrams) {
    all_sent = SendDatagramLocked(*peer, datagram) && all_sent;
  }
  ++stats_.frames_sent;
  return all_sent;
}

void MediaRelay::SweepNow() {
  if (!armed_.load(std::memory_order_acquire)) {
    return;
  }
  std::lock_guard<std::mutex> lock(media_mutex_);
  tracker_.Sweep(clock_->now_utc_us());
}

std::optional<PeerAddress> MediaRelay::ActivePeer() const {
  std::lock_guard<std::mutex> lock(media_mutex_);
  return tracker_.ActivePeer(clock_->now_utc_us());
}

MediaRelay::Stats MediaRelay::stats() const {
  std::lock_guard<std::mutex> lock(media_mutex_);
  Stats stats = stats_;
  stats.next_seq = seq_;
  return stats;
}

void MediaRelay::ReceiveLoop() {
  std::vector<uint8_t> buffer(kMaxDatagramBytes);

  while (!stop_requested_.load(std::memory_order_acquire)) {
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t n = recvfrom(socket_, buffer.data(), buffer.size(), 0,
                               reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      std::cerr << "[MediaRelay] recvfrom failed: " << std::strerror(errno) << std::endl;
      break;
    }

    const auto size = static_cast<std::size_t>(n);
    const bool is_media = wire::DecodeHeader(buffer.data(), size).has_value();

    std::lock_guard<std::mutex> lock(media_mutex_);
    if (is_media) {
      if (!net::IsLoopback(from)) {
        ++stats_.stray_datagrams;
        continue;
      }
      if (!armed_.load(std::memory_order_acquire)) {
        continue;
      }
      const auto peer = tracker_.ActivePeer(clock_->now_utc_us());
      if (peer && SendDatagramLocked(*peer, std::vector<uint8_t>(buffer.begin(),
                                                                  buffer.begin() + n))) {
        ++stats_.datagrams_forwarded;
      }
      continue;
    }

    ++stats_.keepalives_received;
    if (armed_.load(std::memory_order_acquire)) {
      tracker_.Refresh(net::HostOf(from), ntohs(from.sin_port), clock_->now_utc_us());
    }
  }
}

void MediaRelay::SweepLoop() {
  const auto interval = std::chrono::milliseconds(config_.sweep_interval_ms);
  std::unique_lock<std::mutex> lock(sweep_mutex_);
  while (!stop_requested_.load(std::memory_order_acquire)) {
    sweep_cv_.wait_for(lock, interval, [this] {
      return stop_requested_.load(std::memory_order_acquire);
    });
    if (stop_requested_.load(std::memory_order_acquire)) {
      break;
    }
    lock.unlock();
    SweepNow();
    lock.lock();
  }
}

bool MediaRelay::SendDatagramLocked(const PeerAddress& peer,
                                    const std::vector<uint8_t>& datagram) {
  sockaddr_in to{};
  if (!net::ResolveIPv4(peer.host, peer.port, &to)) {
    ++stats_.send_errors;
    return false;
  }
  const ssize_t sent = sendto(socket_, datagram.data(), datagram.size(), 0,
                              reinterpret_cast<const sockaddr*>(&to), sizeof(to));
  if (sent < 0) {
    ++stats_.send_errors;
    return false;
  }
  ++stats_.datagrams_sent;
  return true;
}

}  // namespace mirrorcast::media
