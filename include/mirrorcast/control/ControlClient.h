// Repository: MirrorCast
// Component: Control Client
// Purpose: Viewer side of the control channel; drives the pairing state machine.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_CONTROL_CONTROL_CLIENT_H_
#define MIRRORCAST_CONTROL_CONTROL_CLIENT_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "mirrorcast/control/ControlMessages.h"
#include "mirrorcast/control/HeartbeatMonitor.h"
#include "mirrorcast/control/PairingStateMachine.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::control {

// ControlClient owns one control connection to a host at a time.
//
// Connect() blocks only for the bounded TCP connect. Acceptance arrives on the
// reader thread; a timer thread enforces the handshake deadline and the
// heartbeat timeout and sends heartbeats. Every failure lands in
// Failed(reason), from which Connect() may be retried.
//
// Thread Model:
// - Reader thread: decodes host messages, applies them to the state machine
// - Timer thread: heartbeats, handshake deadline, liveness
// - The update callback runs on either of those threads (or the caller's for
//   Connect/Disconnect) and must not call Connect() or Disconnect().
class ControlClient {
 public:
  using UpdateCallback = std::function<void()>;

  ControlClient(const runtime::ControlConfig& config,
                std::shared_ptr<timing::MasterClock> clock);

  ~ControlClient();

  ControlClient(const ControlClient&) = delete;
  ControlClient& operator=(const ControlClient&) = delete;

  // Opens the control connection and sends the handshake. Returns false if the
  // attempt failed immediately (state is then Failed) or a pairing is already
  // in progress.
  bool Connect(const std::string& peer_name,
               const std::string& host,
               uint16_t port,
               const std::string& code);

  // Closes the connection and returns to Idle.
  void Disconnect();

  // Invoked after every pairing transition, media-port update and broadcast
  // status change.
  void SetUpdateCallback(UpdateCallback callback);

  PairingStatus status() const { return machine_.status(); }
  PairingPhase phase() const { return machine_.phase(); }
  const PairingStateMachine& state_machine() const { return machine_; }

  // Last broadcast status reported by the host on this connection.
  std::optional<bool> broadcast_on() const;

  // Media port from the current Paired status, if any.
  std::optional<uint16_t> media_port() const;

  // Host address of the current or last connection.
  std::string remote_host() const;

 private:
  void ReaderLoop();
  void TimerLoop();

  void HandleLine(const std::string& line);
  void HandleResponse(const HandshakeResponse& response);

  bool SendMessage(const ControlMessage& message);

  // Fails the state machine and tears the socket down; threads exit on their own.
  void Abort(const std::string& reason);

  void StopThreads();
  void NotifyUpdate();

  const runtime::ControlConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;

  PairingStateMachine machine_;

  // Serializes Connect/Disconnect.
  std::mutex lifecycle_mutex_;

  int socket_;
  std::mutex send_mutex_;
  std::atomic<bool> session_stop_;
  std::unique_ptr<std::thread> reader_thread_;
  std::unique_ptr<std::thread> timer_thread_;
  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;

  mutable std::mutex state_mutex_;
  HeartbeatMonitor monitor_;
  int64_t handshake_deadline_utc_us_;
  std::optional<bool> broadcast_on_;
  std::string remote_host_;

  std::mutex callback_mutex_;
  UpdateCallback update_callback_;
};

}  // namespace mirrorcast::control

#endif  // MIRRORCAST_CONTROL_CONTROL_CLIENT_H_
