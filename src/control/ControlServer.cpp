// Repository: MirrorCast
// Component: Control Server
// Purpose: Host TCP listener for pairing handshakes, heartbeats and status push.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/control/ControlServer.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#include "mirrorcast/common/ErrorKind.h"
#include "mirrorcast/common/Identifiers.h"
#include "mirrorcast/common/Overloaded.h"
#include "mirrorcast/control/HeartbeatMonitor.h"
#include "mirrorcast/net/SocketUtil.h"

namespace mirrorcast::control {

namespace {

constexpr int kAcceptPollMs = 100;
constexpr std::size_t kReadChunkBytes = 4096;

int64_t TickIntervalMs(int64_t heartbeat_interval_ms) {
  return std::clamp<int64_t>(heartbeat_interval_ms / 5, 10, 250);
}

}  // namespace

struct ControlServer::Connection {
  Connection(ConnectionId connection_id, int socket, std::string remote_desc,
             int64_t interval_us, int miss_limit)
      : id(connection_id),
        fd(socket),
        remote(std::move(remote_desc)),
        monitor(interval_us, miss_limit) {}

  const ConnectionId id;
  int fd;
  const std::string remote;

  std::mutex send_mutex;

  std::mutex monitor_mutex;
  HeartbeatMonitor monitor;

  std::atomic<bool> closed{false};
  std::atomic<bool> finished{false};
  std::thread reader;
};

ControlServer::ControlServer(const runtime::ControlConfig& config,
                             std::shared_ptr<timing::MasterClock> clock,
                             runtime::BroadcastFlag* broadcast_flag)
    : config_(config),
      clock_(std::move(clock)),
      broadcast_flag_(broadcast_flag),
      registry_(this, config.auto_accept),
      running_(false),
      stop_requested_(false),
      listen_socket_(net::kInvalidSocket),
      bound_port_(0),
      next_connection_id_(1),
      last_broadcast_on_(false),
      last_broadcast_poll_utc_us_(0),
      connections_accepted_(0),
      connections_closed_(0),
      protocol_errors_(0),
      handshake_rejections_(0),
      heartbeat_timeouts_(0),
      broadcast_pushes_(0) {}

ControlServer::~ControlServer() { Stop(); }

bool ControlServer::Start() {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[ControlServer] Already running" << std::endl;
    return false;
  }

  listen_socket_ = net::OpenTcpListener(config_.bind_host, config_.port, &bound_port_);
  if (listen_socket_ == net::kInvalidSocket) {
    std::cerr << "[ControlServer] Failed to listen on port " << config_.port << std::endl;
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_broadcast_on_ = broadcast_flag_ != nullptr && broadcast_flag_->IsBroadcastOn();
    last_broadcast_poll_utc_us_ = clock_->now_utc_us();
  }

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  accept_thread_ = std::make_unique<std::thread>(&ControlServer::AcceptLoop, this);
  ticker_thread_ = std::make_unique<std::thread>(&ControlServer::TickerLoop, this);

  std::cout << "[ControlServer] Listening on port " << bound_port_
            << " (auto_accept=" << (registry_.auto_accept() ? "true" : "false") << ")"
            << std::endl;
  return true;
}

void ControlServer::Stop() {
  if (!running_.load(std::memory_order_acquire) && !accept_thread_ && !ticker_thread_) {
    return;
  }

  std::cout << "[ControlServer] Stopping..." << std::endl;
  stop_requested_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(ticker_mutex_);
    ticker_cv_.notify_all();
  }

  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }
  accept_thread_.reset();
  if (ticker_thread_ && ticker_thread_->joinable()) {
    ticker_thread_->join();
  }
  ticker_thread_.reset();

  std::map<ConnectionId, ConnectionPtr> remaining;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    remaining.swap(connections_);
  }
  for (auto& [id, conn] : remaining) {
    CloseConnection(conn, "server stopping");
  }
  for (auto& [id, conn] : remaining) {
    if (conn->reader.joinable()) {
      conn->reader.join();
    }
    net::CloseSocket(conn->fd);
  }

  net::CloseSocket(listen_socket_);
  running_.store(false, std::memory_order_release);
  std::cout << "[ControlServer] Stopped" << std::endl;
}

void ControlServer::SetMediaPort(uint16_t media_port) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (media_port_ == media_port) {
      return;
    }
    media_port_ = media_port;
  }
  std::cout << "[ControlServer] Media port " << media_port << std::endl;
  PushToPaired(MediaParams{media_port});
}

std::optional<uint16_t> ControlServer::media_port() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return media_port_;
}

std::size_t ControlServer::connection_count() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  std::size_t open = 0;
  for (const auto& [id, conn] : connections_) {
    if (!conn->closed.load(std::memory_order_acquire)) {
      ++open;
    }
  }
  return open;
}

ControlServer::Stats ControlServer::stats() const {
  Stats stats;
  stats.connections_accepted = connections_accepted_.load();
  stats.connections_closed = connections_closed_.load();
  stats.protocol_errors = protocol_errors_.load();
  stats.handshake_rejections = handshake_rejections_.load();
  stats.heartbeat_timeouts = heartbeat_timeouts_.load();
  stats.broadcast_pushes = broadcast_pushes_.load();
  return stats;
}

void ControlServer::SendAccept(ConnectionId connection_id,
                               const std::string& session_id,
                               const std::string& message) {
  ConnectionPtr conn = FindConnection(connection_id);
  if (!conn) {
    return;
  }

  std::optional<uint16_t> port;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    port = media_port_;
  }

  HandshakeResponse response;
  response.ok = true;
  response.session_id = session_id;
  response.udp_port = port;
  if (!message.empty()) {
    response.message = message;
  }
  if (!SendMessage(conn, response)) {
    return;
  }
  if (port) {
    if (!SendMessage(conn, MediaParams{*port})) {
      return;
    }
  }
  const bool on = broadcast_flag_ != nullptr && broadcast_flag_->IsBroadcastOn();
  SendMessage(conn, BroadcastStatus{on});
}

void ControlServer::SendDecline(ConnectionId connection_id, const std::string& message) {
  ConnectionPtr conn = FindConnection(connection_id);
  if (!conn) {
    return;
  }
  HandshakeResponse response;
  response.ok = false;
  response.message = message;
  SendMessage(conn, response);
  CloseConnection(conn, "declined");
}

void ControlServer::AcceptLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    pollfd pfd{};
    pfd.fd = listen_socket_;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, kAcceptPollMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[ControlServer] poll failed: " << std::strerror(errno) << std::endl;
      break;
    }
    if (ready == 0) {
      continue;
    }

    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    const int client = accept(listen_socket_, reinterpret_cast<sockaddr*>(&client_addr),
                              &client_len);
    if (client < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
          errno == ECONNABORTED) {
        continue;
      }
      std::cerr << "[ControlServer] accept failed: " << std::strerror(errno) << std::endl;
      break;
    }

    // A peer that stops reading may hold up the ticker for one interval at most.
    net::SetSendTimeout(client, config_.heartbeat_interval_ms);

    const std::string remote = net::FormatEndpoint(client_addr);
    const int64_t now = clock_->now_utc_us();
    std::lock_guard<std::mutex> lock(connections_mutex_);
    const ConnectionId id = next_connection_id_++;
    auto conn = std::make_shared<Connection>(id, client, remote,
                                             config_.heartbeat_interval_ms * 1'000,
                                             config_.heartbeat_misses);
    conn->monitor.Start(now);
    connections_[id] = conn;
    conn->reader = std::thread(&ControlServer::ReaderLoop, this, conn);
    connections_accepted_.fetch_add(1);
    std::cout << "[ControlServer] conn#" << id << " accepted (remote=" << remote << ")"
              << std::endl;
  }
}

void ControlServer::ReaderLoop(ConnectionPtr conn) {
  LineBuffer buffer;
  std::string line;
  char chunk[kReadChunkBytes];

  while (!conn->closed.load(std::memory_order_acquire)) {
    const ssize_t n = recv(conn->fd, chunk, sizeof(chunk), 0);
    if (n == 0) {
      CloseConnection(conn, "peer closed");
      break;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      CloseConnection(conn, std::string("receive failed: ") + std::strerror(errno));
      break;
    }
    if (!buffer.Append(chunk, static_cast<std::size_t>(n))) {
      protocol_errors_.fetch_add(1);
      CloseConnection(conn, std::string(ErrorKindToString(ErrorKind::kProtocol)) +
                                " (line too long)");
      break;
    }
    while (!conn->closed.load(std::memory_order_acquire) && buffer.NextLine(line)) {
      HandleLine(conn, line);
    }
  }

  conn->finished.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(ticker_mutex_);
  ticker_cv_.notify_all();
}

void ControlServer::HandleLine(const ConnectionPtr& conn, const std::string& line) {
  const auto message = DecodeMessage(line);
  if (!message) {
    protocol_errors_.fetch_add(1);
    CloseConnection(conn, std::string(ErrorKindToString(ErrorKind::kProtocol)) +
                              " (unrecognized line)");
    return;
  }

  {
    std::lock_guard<std::mutex> lock(conn->monitor_mutex);
    conn->monitor.OnMessageReceived(clock_->now_utc_us());
  }

  std::visit(Overloaded{
                 [&](const HandshakeRequest& request) { HandleHandshake(conn, request); },
                 [](const Heartbeat&) {},
                 [&](const auto& unexpected) {
                   protocol_errors_.fetch_add(1);
                   CloseConnection(conn, std::string(ErrorKindToString(ErrorKind::kProtocol)) +
                                             " (unexpected " +
                                             MessageName(ControlMessage{unexpected}) + ")");
                 },
             },
             *message);
}

void ControlServer::HandleHandshake(const ConnectionPtr& conn, const HandshakeRequest& request) {
  if (request.app != kAppId) {
    RejectHandshake(conn, "Unknown app");
    return;
  }
  if (request.ver != kProtocolVersion) {
    RejectHandshake(conn, "Unsupported protocol version");
    return;
  }
  if (request.role != kViewerRole) {
    RejectHandshake(conn, "Unsupported role");
    return;
  }
  if (!IsValidPairingCode(request.code, config_.code_length)) {
    RejectHandshake(conn, "Invalid code");
    return;
  }

  std::cout << "[ControlServer] conn#" << conn->id << " handshake code " << request.code
            << std::endl;
  registry_.OnHandshake(conn->id, request.code, conn->remote, clock_->now_utc_us());
}

void ControlServer::RejectHandshake(const ConnectionPtr& conn, const std::string& message) {
  handshake_rejections_.fetch_add(1);
  HandshakeResponse response;
  response.ok = false;
  response.message = message;
  SendMessage(conn, response);
  CloseConnection(conn, "handshake rejected: " + message);
}

bool ControlServer::SendMessage(const ConnectionPtr& conn, const ControlMessage& message) {
  const std::string line = EncodeMessage(message);
  bool ok = false;
  {
    std::lock_guard<std::mutex> lock(conn->send_mutex);
    if (conn->closed.load(std::memory_order_acquire)) {
      return false;
    }
    ok = net::SendAll(conn->fd, line.data(), line.size());
  }
  if (!ok) {
    CloseConnection(conn, "send failed");
  }
  return ok;
}

void ControlServer::CloseConnection(const ConnectionPtr& conn, const std::string& reason) {
  if (conn->closed.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  {
    // Wait out an in-progress send before waking the reader.
    std::lock_guard<std::mutex> lock(conn->send_mutex);
    net::ShutdownSocket(conn->fd);
  }
  registry_.OnConnectionClosed(conn->id);
  connections_closed_.fetch_add(1);
  std::cout << "[ControlServer] conn#" << conn->id << " closed (" << reason << ")"
            << std::endl;
}

void ControlServer::PushToPaired(const ControlMessage& message) {
  for (const auto& conn : SnapshotConnections()) {
    if (conn->closed.load(std::memory_order_acquire) || !registry_.HasSession(conn->id)) {
      continue;
    }
    SendMessage(conn, message);
  }
}

void ControlServer::TickerLoop() {
  const auto tick = std::chrono::milliseconds(TickIntervalMs(config_.heartbeat_interval_ms));
  std::unique_lock<std::mutex> lock(ticker_mutex_);
  while (!stop_requested_.load(std::memory_order_acquire)) {
    ticker_cv_.wait_for(lock, tick, [this] {
      return stop_requested_.load(std::memory_order_acquire);
    });
    if (stop_requested_.load(std::memory_order_acquire)) {
      break;
    }
    lock.unlock();
    Tick();
    lock.lock();
  }
}

void ControlServer::Tick() {
  const int64_t now = clock_->now_utc_us();

  for (const auto& conn : SnapshotConnections()) {
    if (conn->closed.load(std::memory_order_acquire)) {
      continue;
    }
    bool expired = false;
    bool due = false;
    {
      std::lock_guard<std::mutex> lock(conn->monitor_mutex);
      expired = conn->monitor.IsExpired(now);
      due = !expired && conn->monitor.IsHeartbeatDue(now);
      if (due) {
        conn->monitor.OnHeartbeatSent(now);
      }
    }
    if (expired) {
      heartbeat_timeouts_.fetch_add(1);
      CloseConnection(conn, "heartbeat timeout");
    } else if (due) {
      SendMessage(conn, Heartbeat{});
    }
  }

  if (broadcast_flag_ != nullptr) {
    std::optional<bool> changed;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (now - last_broadcast_poll_utc_us_ >= config_.broadcast_poll_ms * 1'000) {
        last_broadcast_poll_utc_us_ = now;
        const bool on = broadcast_flag_->IsBroadcastOn();
        if (on != last_broadcast_on_) {
          last_broadcast_on_ = on;
          changed = on;
        }
      }
    }
    if (changed) {
      std::cout << "[ControlServer] Broadcast " << (*changed ? "on" : "off") << std::endl;
      broadcast_pushes_.fetch_add(1);
      PushToPaired(BroadcastStatus{*changed});
    }
  }

  ReapFinishedConnections();
}

ControlServer::ConnectionPtr ControlServer::FindConnection(ConnectionId connection_id) const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ControlServer::ConnectionPtr> ControlServer::SnapshotConnections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  std::vector<ConnectionPtr> snapshot;
  snapshot.reserve(connections_.size());
  for (const auto& [id, conn] : connections_) {
    snapshot.push_back(conn);
  }
  return snapshot;
}

void ControlServer::ReapFinishedConnections() {
  std::vector<ConnectionPtr> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (it->second->finished.load(std::memory_order_acquire)) {
        finished.push_back(it->second);
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& conn : finished) {
    if (conn->reader.joinable()) {
      conn->reader.join();
    }
    net::CloseSocket(conn->fd);
  }
}

}  // namespace mirrorcast::control
