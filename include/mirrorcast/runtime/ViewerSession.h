// Repository: MirrorCast
// Component: Viewer Session
// Purpose: Start viewer media only when paired, broadcasting and port known.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_RUNTIME_VIEWER_SESSION_H_
#define MIRRORCAST_RUNTIME_VIEWER_SESSION_H_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "mirrorcast/control/ControlClient.h"
#include "mirrorcast/media/MediaReceiver.h"

namespace mirrorcast::runtime {

// ViewerSession keeps the media receiver in step with the control client.
// Pairing alone never starts media: the host must also report broadcast on
// and a media port must be known.
class ViewerSession {
 public:
  ViewerSession(control::ControlClient* client, media::MediaReceiver* receiver);
  ~ViewerSession();

  ViewerSession(const ViewerSession&) = delete;
  ViewerSession& operator=(const ViewerSession&) = delete;

  // Subscribes to client updates and reconciles once.
  void Attach();

  // Unsubscribes and stops media.
  void Detach();

  // Applies the current client state to the receiver.
  void Reconcile();

  bool media_active() const;
  uint64_t media_starts() const;

 private:
  struct Target {
    std::string host;
    uint16_t port = 0;
    bool operator==(const Target& other) const {
      return host == other.host && port == other.port;
    }
  };

  std::optional<Target> DesiredTarget() const;

  control::ControlClient* client_;
  media::MediaReceiver* receiver_;

  mutable std::mutex mutex_;
  std::optional<Target> active_;
  uint64_t media_starts_;
};

}  // namespace mirrorcast::runtime

#endif  // MIRRORCAST_RUNTIME_VIEWER_SESSION_H_
