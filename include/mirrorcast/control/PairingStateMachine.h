// Repository: MirrorCast
// Component: Pairing State Machine
// Purpose: Viewer-side pairing lifecycle with an exhaustively matched status.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_CONTROL_PAIRING_STATE_MACHINE_H_
#define MIRRORCAST_CONTROL_PAIRING_STATE_MACHINE_H_

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "mirrorcast/common/Overloaded.h"

namespace mirrorcast::control {

struct Idle {};
struct Connecting {
  std::string peer_name;
};
struct WaitingAcceptance {};
struct Paired {
  std::string session_id;
  std::optional<uint16_t> media_port;
};
struct Failed {
  std::string reason;
};

using PairingStatus = std::variant<Idle, Connecting, WaitingAcceptance, Paired, Failed>;

enum class PairingPhase {
  kIdle = 0,
  kConnecting = 1,
  kWaitingAcceptance = 2,
  kPaired = 3,
  kFailed = 4,
};

PairingPhase PhaseOf(const PairingStatus& status);
const char* PhaseToString(PairingPhase phase);

// One-line human readable form, e.g. "Paired(3f2a..., port=50123)".
std::string DescribeStatus(const PairingStatus& status);

// PairingStateMachine is the viewer's view of one pairing attempt.
//
//   Idle --BeginConnect--> Connecting --OnHandshakeSent--> WaitingAcceptance
//   WaitingAcceptance --OnAccepted--> Paired
//   WaitingAcceptance --OnDeclined--> Failed
//   any non-idle --Fail--> Failed
//   any non-idle --Cancel--> Idle
//   Failed --BeginConnect--> Connecting (retry)
//
// Events that do not apply to the current state are rejected and counted as
// illegal transitions. The listener observes every accepted transition in
// order; it must not call back into the mutating methods.
class PairingStateMachine {
 public:
  using TransitionListener =
      std::function<void(const PairingStatus& from, const PairingStatus& to)>;

  struct MetricsSnapshot {
    std::map<std::pair<PairingPhase, PairingPhase>, uint64_t> transitions;
    uint64_t illegal_transition_total = 0;
    uint64_t failure_total = 0;
    PairingPhase phase = PairingPhase::kIdle;
  };

  PairingStateMachine();

  PairingStateMachine(const PairingStateMachine&) = delete;
  PairingStateMachine& operator=(const PairingStateMachine&) = delete;

  void SetTransitionListener(TransitionListener listener);

  bool BeginConnect(const std::string& peer_name);
  bool OnHandshakeSent();
  bool OnAccepted(const std::string& session_id, std::optional<uint16_t> media_port);
  bool OnDeclined(const std::string& message);

  // Updates the media port of the current session. Only valid while Paired.
  bool OnMediaParams(uint16_t media_port);

  // Transport error, timeout or protocol error. A second failure while already
  // Failed keeps the first reason and returns false.
  bool Fail(const std::string& reason);

  bool Cancel();

  [[nodiscard]] PairingStatus status() const;
  [[nodiscard]] PairingPhase phase() const;
  [[nodiscard]] MetricsSnapshot Snapshot() const;

 private:
  bool TransitionTo(PairingStatus next,
                    std::initializer_list<PairingPhase> allowed_from,
                    bool quiet_from_failed = false);
  void RecordIllegalTransitionLocked(PairingPhase from, PairingPhase attempted_to);

  // Held across a transition and its notification so listeners observe
  // transitions in the order they were applied.
  std::mutex notify_mutex_;
  mutable std::mutex mutex_;

  PairingStatus status_;
  std::map<std::pair<PairingPhase, PairingPhase>, uint64_t> transitions_;
  uint64_t illegal_transition_total_;
  uint64_t failure_total_;
  TransitionListener listener_;
};

}  // namespace mirrorcast::control

#endif  // MIRRORCAST_CONTROL_PAIRING_STATE_MACHINE_H_
