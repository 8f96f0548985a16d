// Repository: MirrorCast
// Component: Session Registry
// Purpose: Host-side sessions and pending pairs; accept/decline/auto-accept.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_CONTROL_SESSION_REGISTRY_H_
#define MIRRORCAST_CONTROL_SESSION_REGISTRY_H_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mirrorcast::control {

using ConnectionId = uint64_t;

struct Session {
  std::string id;
  ConnectionId connection_id = 0;
  std::string remote_description;
  int64_t started_utc_us = 0;
};

struct PendingPair {
  std::string id;
  std::string code;
  ConnectionId connection_id = 0;
  std::string remote_description;
  int64_t requested_utc_us = 0;
};

// PairingResponder delivers registry decisions onto the owning connection.
// Implemented by the control server; called without registry locks held.
class PairingResponder {
 public:
  virtual ~PairingResponder() = default;

  virtual void SendAccept(ConnectionId connection_id,
                          const std::string& session_id,
                          const std::string& message) = 0;
  virtual void SendDecline(ConnectionId connection_id, const std::string& message) = 0;
};

enum class HandshakeDisposition {
  kAccepted,       // Session created (auto-accept)
  kAlreadyPaired,  // Connection owns a session; re-acknowledged
  kPending,        // Queued for explicit accept/decline
};

struct HandshakeOutcome {
  HandshakeDisposition disposition = HandshakeDisposition::kPending;
  std::string id;  // Session id, or pending-pair id when kPending
};

struct ConnectionClosedOutcome {
  std::optional<std::string> removed_session_id;
  std::optional<std::string> removed_pending_id;
};

// SessionRegistry is the accepting side's source of truth.
//
// Invariants:
// - At most one PendingPair per connection; a second handshake on the same
//   connection replaces the earlier row.
// - At most one Session per connection.
// - Closing a connection removes whatever it owns before returning.
class SessionRegistry {
 public:
  explicit SessionRegistry(PairingResponder* responder, bool auto_accept = false);

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  HandshakeOutcome OnHandshake(ConnectionId connection_id,
                               const std::string& code,
                               const std::string& remote_description,
                               int64_t now_utc_us);

  // Returns the created session, or nullopt when `pending_id` is unknown.
  std::optional<Session> Accept(const std::string& pending_id, int64_t now_utc_us);

  // Returns false when `pending_id` is unknown.
  bool Decline(const std::string& pending_id);

  ConnectionClosedOutcome OnConnectionClosed(ConnectionId connection_id);

  void SetAutoAccept(bool enabled);
  bool auto_accept() const;

  std::vector<PendingPair> PendingPairs() const;
  std::vector<Session> Sessions() const;
  std::optional<Session> SessionForConnection(ConnectionId connection_id) const;
  bool HasSession(ConnectionId connection_id) const;

 private:
  Session CreateSessionLocked(ConnectionId connection_id,
                              const std::string& remote_description,
                              int64_t now_utc_us);

  PairingResponder* responder_;

  mutable std::mutex mutex_;
  bool auto_accept_;
  std::vector<PendingPair> pending_;
  std::vector<Session> sessions_;
};

}  // namespace mirrorcast::control

#endif  // MIRRORCAST_CONTROL_SESSION_REGISTRY_H_
