// Repository: MirrorCast
// Component: Control Client
// Purpose: Viewer side of the control channel; drives the pairing state machine.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/control/ControlClient.h"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#include "mirrorcast/common/ErrorKind.h"
#include "mirrorcast/common/Overloaded.h"
#include "mirrorcast/net/SocketUtil.h"

namespace mirrorcast::control {

namespace {

constexpr std::size_t kReadChunkBytes = 4096;

}  // namespace

ControlClient::ControlClient(const runtime::ControlConfig& config,
                             std::shared_ptr<timing::MasterClock> clock)
    : config_(config),
      clock_(std::move(clock)),
      socket_(net::kInvalidSocket),
      session_stop_(false),
      monitor_(config.heartbeat_interval_ms * 1'000, config.heartbeat_misses),
      handshake_deadline_utc_us_(0) {
  machine_.SetTransitionListener(
      [this](const PairingStatus&, const PairingStatus&) { NotifyUpdate(); });
}

ControlClient::~ControlClient() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  StopThreads();
}

void ControlClient::SetUpdateCallback(UpdateCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  update_callback_ = std::move(callback);
}

bool ControlClient::Connect(const std::string& peer_name,
                            const std::string& host,
                            uint16_t port,
                            const std::string& code) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  // Leftover threads from a failed attempt.
  StopThreads();

  if (!machine_.BeginConnect(peer_name)) {
    return false;
  }

  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    broadcast_on_.reset();
    remote_host_ = host;
  }

  std::cout << "[ControlClient] Connecting to " << peer_name << " @ " << host << ":" << port
            << " with code " << code << std::endl;
  std::string error;
  socket_ = net::ConnectTcp(host, port, config_.connect_timeout_ms, &error);
  if (socket_ == net::kInvalidSocket) {
    machine_.Fail("connect failed: " + error);
    return false;
  }
  net::SetSendTimeout(socket_, config_.heartbeat_interval_ms);

  const int64_t now = clock_->now_utc_us();
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    monitor_ = HeartbeatMonitor(config_.heartbeat_interval_ms * 1'000,
                                config_.heartbeat_misses);
    monitor_.Start(now);
    handshake_deadline_utc_us_ = now + config_.handshake_timeout_ms * 1'000;
  }
  session_stop_.store(false, std::memory_order_release);

  HandshakeRequest request;
  request.code = code;
  if (!SendMessage(request)) {
    machine_.Fail("send failed");
    net::CloseSocket(socket_);
    return false;
  }
  machine_.OnHandshakeSent();

  reader_thread_ = std::make_unique<std::thread>(&ControlClient::ReaderLoop, this);
  timer_thread_ = std::make_unique<std::thread>(&ControlClient::TimerLoop, this);
  return true;
}

void ControlClient::Disconnect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  StopThreads();
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    broadcast_on_.reset();
  }
  if (machine_.phase() != PairingPhase::kIdle) {
    machine_.Cancel();
  }
}

std::optional<bool> ControlClient::broadcast_on() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return broadcast_on_;
}

std::optional<uint16_t> ControlClient::media_port() const {
  const PairingStatus current = machine_.status();
  if (const auto* paired = std::get_if<Paired>(&current)) {
    return paired->media_port;
  }
  return std::nullopt;
}

std::string ControlClient::remote_host() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return remote_host_;
}

void ControlClient::ReaderLoop() {
  LineBuffer buffer;
  std::string line;
  char chunk[kReadChunkBytes];

  while (!session_stop_.load(std::memory_order_acquire)) {
    const ssize_t n = recv(socket_, chunk, sizeof(chunk), 0);
    if (n == 0) {
      Abort("connection closed by host");
      break;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      Abort(std::string("receive failed: ") + std::strerror(errno));
      break;
    }
    if (!buffer.Append(chunk, static_cast<std::size_t>(n))) {
      Abort(ErrorKindToString(ErrorKind::kProtocol));
      break;
    }
    while (!session_stop_.load(std::memory_order_acquire) && buffer.NextLine(line)) {
      HandleLine(line);
    }
  }
}

void ControlClient::TimerLoop() {
  const auto tick =
      std::chrono::milliseconds(std::clamp<int64_t>(config_.heartbeat_interval_ms / 5, 10, 250));
  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!session_stop_.load(std::memory_order_acquire)) {
    timer_cv_.wait_for(lock, tick, [this] {
      return session_stop_.load(std::memory_order_acquire);
    });
    if (session_stop_.load(std::memory_order_acquire)) {
      break;
    }
    lock.unlock();

    const int64_t now = clock_->now_utc_us();
    bool handshake_expired = false;
    bool expired = false;
    bool due = false;
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      handshake_expired = machine_.phase() == PairingPhase::kWaitingAcceptance &&
                          now >= handshake_deadline_utc_us_;
      expired = monitor_.IsExpired(now);
      due = !expired && monitor_.IsHeartbeatDue(now);
      if (due) {
        monitor_.OnHeartbeatSent(now);
      }
    }
    if (handshake_expired) {
      Abort("handshake timeout");
    } else if (expired) {
      Abort("heartbeat timeout");
    } else if (due) {
      SendMessage(Heartbeat{});
    }

    lock.lock();
  }
}

void ControlClient::HandleLine(const std::string& line) {
  const auto message = DecodeMessage(line);
  if (!message) {
    std::cerr << "[ControlClient] Unrecognized line from host" << std::endl;
    Abort(ErrorKindToString(ErrorKind::kProtocol));
    return;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    monitor_.OnMessageReceived(clock_->now_utc_us());
  }

  std::visit(Overloaded{
                 [this](const HandshakeResponse& response) { HandleResponse(response); },
                 [](const Heartbeat&) {},
                 [this](const BroadcastStatus& status) {
                   {
                     std::lock_guard<std::mutex> lock(state_mutex_);
                     broadcast_on_ = status.on;
                   }
                   std::cout << "[ControlClient] Host broadcast "
                             << (status.on ? "on" : "off") << std::endl;
                   NotifyUpdate();
                 },
                 [this](const MediaParams& params) { machine_.OnMediaParams(params.udp_port); },
                 [this](const HandshakeRequest&) {
                   std::cerr << "[ControlClient] Unexpected HandshakeRequest from host"
                             << std::endl;
                   Abort(ErrorKindToString(ErrorKind::kProtocol));
                 },
             },
             *message);
}

void ControlClient::HandleResponse(const HandshakeResponse& response) {
  const PairingPhase current = machine_.phase();
  if (current == PairingPhase::kPaired) {
    // Re-acknowledgement of an existing session.
    return;
  }
  if (current != PairingPhase::kWaitingAcceptance) {
    Abort(ErrorKindToString(ErrorKind::kProtocol));
    return;
  }

  if (response.ok) {
    machine_.OnAccepted(*response.session_id, response.udp_port);
    return;
  }

  machine_.OnDeclined(response.message.value_or("Declined"));
  session_stop_.store(true, std::memory_order_release);
  net::ShutdownSocket(socket_);
  std::lock_guard<std::mutex> lock(timer_mutex_);
  timer_cv_.notify_all();
}

bool ControlClient::SendMessage(const ControlMessage& message) {
  const std::string line = EncodeMessage(message);
  bool ok = false;
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (socket_ == net::kInvalidSocket) {
      return false;
    }
    ok = net::SendAll(socket_, line.data(), line.size());
  }
  if (!ok && !session_stop_.load(std::memory_order_acquire)) {
    Abort("send failed");
  }
  return ok;
}

void ControlClient::Abort(const std::string& reason) {
  if (session_stop_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  std::cerr << "[ControlClient] " << reason << std::endl;
  machine_.Fail(reason);
  net::ShutdownSocket(socket_);
  std::lock_guard<std::mutex> lock(timer_mutex_);
  timer_cv_.notify_all();
}

void ControlClient::StopThreads() {
  session_stop_.store(true, std::memory_order_release);
  net::ShutdownSocket(socket_);
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_cv_.notify_all();
  }
  if (reader_thread_ && reader_thread_->joinable()) {
    reader_thread_->join();
  }
  reader_thread_.reset();
  if (timer_thread_ && timer_thread_->joinable()) {
    timer_thread_->join();
  }
  timer_thread_.reset();

  std::lock_guard<std::mutex> lock(send_mutex_);
  net::CloseSocket(socket_);
}

void ControlClient::NotifyUpdate() {
  UpdateCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = update_callback_;
  }
  if (callback) {
    callback();
  }
}

}  // namespace mirrorcast::control
