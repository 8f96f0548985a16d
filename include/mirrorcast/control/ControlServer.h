// Repository: MirrorCast
// Component: Control Server
// Purpose: Host TCP listener for pairing handshakes, heartbeats and status push.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_CONTROL_CONTROL_SERVER_H_
#define MIRRORCAST_CONTROL_CONTROL_SERVER_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mirrorcast/control/ControlMessages.h"
#include "mirrorcast/control/SessionRegistry.h"
#include "mirrorcast/runtime/BroadcastFlag.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::control {

// ControlServer is the accepting side of the control channel.
//
// Features:
// - Any number of concurrent viewer connections
// - Handshake validation (app id, protocol version, role, code format)
// - Auto-accept or operator accept/decline via the SessionRegistry
// - Heartbeats to every connection, teardown on missed heartbeats
// - BroadcastStatus pushed to paired viewers when the flag changes
// - MediaParams pushed when the media port becomes known
//
// Thread Model:
// - One accept thread
// - One reader thread per connection, so a stalled viewer blocks nobody else
// - One ticker thread for heartbeats, liveness, broadcast polling and reaping
// - Writes to a connection are serialized on that connection's send mutex
//
// Closing a connection deregisters its session or pending pair before the
// close call returns.
class ControlServer : public PairingResponder {
 public:
  struct Stats {
    uint64_t connections_accepted = 0;
    uint64_t connections_closed = 0;
    uint64_t protocol_errors = 0;
    uint64_t handshake_rejections = 0;
    uint64_t heartbeat_timeouts = 0;
    uint64_t broadcast_pushes = 0;
  };

  ControlServer(const runtime::ControlConfig& config,
                std::shared_ptr<timing::MasterClock> clock,
                runtime::BroadcastFlag* broadcast_flag);

  ~ControlServer() override;

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Binds the control port and starts the accept and ticker threads.
  bool Start();

  // Closes every connection and joins all threads.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound control port (resolves an ephemeral request once started).
  uint16_t port() const { return bound_port_; }

  SessionRegistry& registry() { return registry_; }
  const SessionRegistry& registry() const { return registry_; }

  // Records the media relay port and tells every paired viewer about it.
  void SetMediaPort(uint16_t media_port);
  std::optional<uint16_t> media_port() const;

  std::size_t connection_count() const;
  Stats stats() const;

  // PairingResponder
  void SendAccept(ConnectionId connection_id,
                  const std::string& session_id,
                  const std::string& message) override;
  void SendDecline(ConnectionId connection_id, const std::string& message) override;

 private:
  struct Connection;
  using ConnectionPtr = std::shared_ptr<Connection>;

  void AcceptLoop();
  void ReaderLoop(ConnectionPtr conn);
  void TickerLoop();
  void Tick();

  void HandleLine(const ConnectionPtr& conn, const std::string& line);
  void HandleHandshake(const ConnectionPtr& conn, const HandshakeRequest& request);
  void RejectHandshake(const ConnectionPtr& conn, const std::string& message);

  bool SendMessage(const ConnectionPtr& conn, const ControlMessage& message);
  void CloseConnection(const ConnectionPtr& conn, const std::string& reason);
  void PushToPaired(const ControlMessage& message);

  ConnectionPtr FindConnection(ConnectionId connection_id) const;
  std::vector<ConnectionPtr> SnapshotConnections() const;
  void ReapFinishedConnections();

  const runtime::ControlConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  runtime::BroadcastFlag* broadcast_flag_;

  SessionRegistry registry_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  int listen_socket_;
  uint16_t bound_port_;

  std::unique_ptr<std::thread> accept_thread_;
  std::unique_ptr<std::thread> ticker_thread_;
  std::mutex ticker_mutex_;
  std::condition_variable ticker_cv_;

  mutable std::mutex connections_mutex_;
  std::map<ConnectionId, ConnectionPtr> connections_;
  ConnectionId next_connection_id_;

  mutable std::mutex state_mutex_;
  std::optional<uint16_t> media_port_;
  bool last_broadcast_on_;
  int64_t last_broadcast_poll_utc_us_;

  std::atomic<uint64_t> connections_accepted_;
  std::atomic<uint64_t> connections_closed_;
  std::atomic<uint64_t> protocol_errors_;
  std::atomic<uint64_t> handshake_rejections_;
  std::atomic<uint64_t> heartbeat_timeouts_;
  std::atomic<uint64_t> broadcast_pushes_;
};

}  // namespace mirrorcast::control

#endif  // MIRRORCAST_CONTROL_CONTROL_SERVER_H_
