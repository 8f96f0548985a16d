// Repository: MirrorCast
// Component: Pairing State Machine
// Purpose: Viewer-side pairing lifecycle with an exhaustively matched status.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/control/PairingStateMachine.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace mirrorcast::control
{

  PairingPhase PhaseOf(const PairingStatus &status)
  {
    return std::visit(
        Overloaded{
            [](const Idle &) { return PairingPhase::kIdle; },
            [](const Connecting &) { return PairingPhase::kConnecting; },
            [](const WaitingAcceptance &) { return PairingPhase::kWaitingAcceptance; },
            [](const Paired &) { return PairingPhase::kPaired; },
            [](const Failed &) { return PairingPhase::kFailed; },
        },
        status);
  }

  const char *PhaseToString(PairingPhase phase)
  {
    switch (phase)
    {
    case PairingPhase::kIdle:
      return "idle";
    case PairingPhase::kConnecting:
      return "connecting";
    case PairingPhase::kWaitingAcceptance:
      return "waiting_acceptance";
    case PairingPhase::kPaired:
      return "paired";
    case PairingPhase::kFailed:
      return "failed";
    }
    return "unknown";
  }

  std::string DescribeStatus(const PairingStatus &status)
  {
    return std::visit(
        Overloaded{
            [](const Idle &) -> std::string { return "Idle"; },
            [](const Connecting &s) -> std::string
            { return "Connecting(" + s.peer_name + ")"; },
            [](const WaitingAcceptance &) -> std::string { return "WaitingAcceptance"; },
            [](const Paired &s) -> std::string
            {
              std::ostringstream out;
              out << "Paired(" << s.session_id;
              if (s.media_port)
              {
                out << ", port=" << *s.media_port;
              }
              out << ")";
              return out.str();
            },
            [](const Failed &s) -> std::string { return "Failed(" + s.reason + ")"; },
        },
        status);
  }

  PairingStateMachine::PairingStateMachine()
      : status_(Idle{}),
        illegal_transition_total_(0),
        failure_total_(0) {}

  void PairingStateMachine::SetTransitionListener(TransitionListener listener)
  {
    std::lock_guard<std::mutex> notify_lock(notify_mutex_);
    listener_ = std::move(listener);
  }

  bool PairingStateMachine::BeginConnect(const std::string &peer_name)
  {
    return TransitionTo(Connecting{peer_name}, {PairingPhase::kIdle, PairingPhase::kFailed});
  }

  bool PairingStateMachine::OnHandshakeSent()
  {
    return TransitionTo(WaitingAcceptance{}, {PairingPhase::kConnecting});
  }

  bool PairingStateMachine::OnAccepted(const std::string &session_id,
                                       std::optional<uint16_t> media_port)
  {
    return TransitionTo(Paired{session_id, media_port}, {PairingPhase::kWaitingAcceptance});
  }

  bool PairingStateMachine::OnDeclined(const std::string &message)
  {
    return TransitionTo(Failed{message.empty() ? std::string("Declined") : message},
                        {PairingPhase::kWaitingAcceptance});
  }

  bool PairingStateMachine::OnMediaParams(uint16_t media_port)
  {
    std::lock_guard<std::mutex> notify_lock(notify_mutex_);
    PairingStatus from;
    PairingStatus to;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto *paired = std::get_if<Paired>(&status_);
      if (paired == nullptr)
      {
        return false;
      }
      if (paired->media_port == media_port)
      {
        return true;
      }
      from = status_;
      paired->media_port = media_port;
      to = status_;
    }
    if (listener_)
    {
      listener_(from, to);
    }
    return true;
  }

  bool PairingStateMachine::Fail(const std::string &reason)
  {
    return TransitionTo(Failed{reason},
                        {PairingPhase::kConnecting, PairingPhase::kWaitingAcceptance,
                         PairingPhase::kPaired},
                        /*quiet_from_failed=*/true);
  }

  bool PairingStateMachine::Cancel()
  {
    return TransitionTo(Idle{},
                        {PairingPhase::kConnecting, PairingPhase::kWaitingAcceptance,
                         PairingPhase::kPaired, PairingPhase::kFailed});
  }

  PairingStatus PairingStateMachine::status() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
  }

  PairingPhase PairingStateMachine::phase() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return PhaseOf(status_);
  }

  PairingStateMachine::MetricsSnapshot PairingStateMachine::Snapshot() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsSnapshot snapshot;
    snapshot.transitions = transitions_;
    snapshot.illegal_transition_total = illegal_transition_total_;
    snapshot.failure_total = failure_total_;
    snapshot.phase = PhaseOf(status_);
    return snapshot;
  }

  bool PairingStateMachine::TransitionTo(PairingStatus next,
                                         std::initializer_list<PairingPhase> allowed_from,
                                         bool quiet_from_failed)
  {
    std::lock_guard<std::mutex> notify_lock(notify_mutex_);
    PairingStatus from;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const PairingPhase current = PhaseOf(status_);
      const PairingPhase target = PhaseOf(next);
      if (quiet_from_failed && current == PairingPhase::kFailed)
      {
        return false;
      }
      if (std::find(allowed_from.begin(), allowed_from.end(), current) == allowed_from.end())
      {
        RecordIllegalTransitionLocked(current, target);
        return false;
      }
      from = status_;
      status_ = next;
      ++transitions_[{current, target}];
      if (target == PairingPhase::kFailed)
      {
        ++failure_total_;
      }
    }

    std::cout << "[PairingStateMachine] " << DescribeStatus(from) << " -> "
              << DescribeStatus(next) << std::endl;
    if (listener_)
    {
      listener_(from, next);
    }
    return true;
  }

  void PairingStateMachine::RecordIllegalTransitionLocked(PairingPhase from,
                                                          PairingPhase attempted_to)
  {
    ++illegal_transition_total_;
    std::cerr << "[PairingStateMachine] Illegal transition " << PhaseToString(from)
              << " -> " << PhaseToString(attempted_to) << std::endl;
  }

} // namespace mirrorcast::control
