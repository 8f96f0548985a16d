// Repository: MirrorCast
// Component: Session Registry
// Purpose: Host-side sessions and pending pairs; accept/decline/auto-accept.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/control/SessionRegistry.h"

#include <algorithm>
#include <iostream>

#include "mirrorcast/common/Identifiers.h"

namespace mirrorcast::control {

namespace {

constexpr char kAlreadyPairedMessage[] = "Already paired";
constexpr char kDeclinedMessage[] = "Declined";

}  // namespace

SessionRegistry::SessionRegistry(PairingResponder* responder, bool auto_accept)
    : responder_(responder), auto_accept_(auto_accept) {}

HandshakeOutcome SessionRegistry::OnHandshake(ConnectionId connection_id,
                                              const std::string& code,
                                              const std::string& remote_description,
                                              int64_t now_utc_us) {
  HandshakeOutcome outcome;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = std::find_if(sessions_.begin(), sessions_.end(),
                                 [connection_id](const Session& s) {
                                   return s.connection_id == connection_id;
                                 });
    if (existing != sessions_.end()) {
      outcome.disposition = HandshakeDisposition::kAlreadyPaired;
      outcome.id = existing->id;
    } else {
      pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                    [connection_id](const PendingPair& p) {
                                      return p.connection_id == connection_id;
                                    }),
                     pending_.end());
      if (auto_accept_) {
        outcome.disposition = HandshakeDisposition::kAccepted;
        outcome.id = CreateSessionLocked(connection_id, remote_description, now_utc_us).id;
        std::cout << "[SessionRegistry] conn#" << connection_id << " auto-accepted code "
                  << code << " (session=" << outcome.id << ")" << std::endl;
      } else {
        PendingPair pending;
        pending.id = GenerateUuidV4();
        pending.code = code;
        pending.connection_id = connection_id;
        pending.remote_description = remote_description;
        pending.requested_utc_us = now_utc_us;
        pending_.push_back(pending);
        outcome.disposition = HandshakeDisposition::kPending;
        outcome.id = pending.id;
        std::cout << "[SessionRegistry] conn#" << connection_id << " pending code " << code
                  << " (pending=" << pending_.size() << ")" << std::endl;
      }
    }
  }

  if (responder_ == nullptr) {
    return outcome;
  }
  switch (outcome.disposition) {
    case HandshakeDisposition::kAccepted:
      responder_->SendAccept(connection_id, outcome.id, "");
      break;
    case HandshakeDisposition::kAlreadyPaired:
      responder_->SendAccept(connection_id, outcome.id, kAlreadyPairedMessage);
      break;
    case HandshakeDisposition::kPending:
      break;
  }
  return outcome;
}

std::optional<Session> SessionRegistry::Accept(const std::string& pending_id,
                                               int64_t now_utc_us) {
  Session session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&pending_id](const PendingPair& p) { return p.id == pending_id; });
    if (it == pending_.end()) {
      return std::nullopt;
    }
    const PendingPair pending = *it;
    pending_.erase(it);
    session = CreateSessionLocked(pending.connection_id, pending.remote_description, now_utc_us);
    std::cout << "[SessionRegistry] conn#" << pending.connection_id << " accepted (session="
              << session.id << ")" << std::endl;
  }
  if (responder_ != nullptr) {
    responder_->SendAccept(session.connection_id, session.id, "");
  }
  return session;
}

bool SessionRegistry::Decline(const std::string& pending_id) {
  ConnectionId connection_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&pending_id](const PendingPair& p) { return p.id == pending_id; });
    if (it == pending_.end()) {
      return false;
    }
    connection_id = it->connection_id;
    pending_.erase(it);
    std::cout << "[SessionRegistry] conn#" << connection_id << " declined" << std::endl;
  }
  if (responder_ != nullptr) {
    responder_->SendDecline(connection_id, kDeclinedMessage);
  }
  return true;
}

ConnectionClosedOutcome SessionRegistry::OnConnectionClosed(ConnectionId connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  ConnectionClosedOutcome outcome;

  auto pending = std::find_if(pending_.begin(), pending_.end(),
                              [connection_id](const PendingPair& p) {
                                return p.connection_id == connection_id;
                              });
  if (pending != pending_.end()) {
    outcome.removed_pending_id = pending->id;
    pending_.erase(pending);
  }

  auto session = std::find_if(sessions_.begin(), sessions_.end(),
                              [connection_id](const Session& s) {
                                return s.connection_id == connection_id;
                              });
  if (session != sessions_.end()) {
    outcome.removed_session_id = session->id;
    sessions_.erase(session);
    std::cout << "[SessionRegistry] conn#" << connection_id << " session "
              << *outcome.removed_session_id << " removed" << std::endl;
  }
  return outcome;
}

void SessionRegistry::SetAutoAccept(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto_accept_ = enabled;
}

bool SessionRegistry::auto_accept() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return auto_accept_;
}

std::vector<PendingPair> SessionRegistry::PendingPairs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

std::vector<Session> SessionRegistry::Sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_;
}

std::optional<Session> SessionRegistry::SessionForConnection(
    ConnectionId connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& session : sessions_) {
    if (session.connection_id == connection_id) {
      return session;
    }
  }
  return std::nullopt;
}

bool SessionRegistry::HasSession(ConnectionId connection_id) const {
  return SessionForConnection(connection_id).has_value();
}

Session SessionRegistry::CreateSessionLocked(ConnectionId connection_id,
                                             const std::string& remote_description,
                                             int64_t now_utc_us) {
  Session session;
  session.id = GenerateUuidV4();
  session.connection_id = connection_id;
  session.remote_description = remote_description;
  session.started_utc_us = now_utc_us;
  sessions_.push_back(session);
  return session;
}

}  // namespace mirrorcast::control
