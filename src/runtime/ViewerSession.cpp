// Repository: MirrorCast
// Component: Viewer Session
// Purpose: Start viewer media only when paired, broadcasting and port known.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/runtime/ViewerSession.h"

#include <iostream>

namespace mirrorcast::runtime {

ViewerSession::ViewerSession(control::ControlClient* client, media::MediaReceiver* receiver)
    : client_(client), receiver_(receiver), media_starts_(0) {}

ViewerSession::~ViewerSession() { Detach(); }

void ViewerSession::Attach() {
  client_->SetUpdateCallback([this] { Reconcile(); });
  Reconcile();
}

void ViewerSession::Detach() {
  client_->SetUpdateCallback(nullptr);
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_) {
    receiver_->Stop();
    active_.reset();
  }
}

void ViewerSession::Reconcile() {
  // Client state is read under the lock: whichever client thread reconciles
  // last must see every update made before it.
  std::lock_guard<std::mutex> lock(mutex_);
  const auto desired = DesiredTarget();
  if (desired == active_) {
    return;
  }
  if (active_) {
    std::cout << "[ViewerSession] Stopping media from " << active_->host << ":"
              << active_->port << std::endl;
    receiver_->Stop();
    active_.reset();
  }
  if (desired) {
    std::cout << "[ViewerSession] Starting media from " << desired->host << ":"
              << desired->port << std::endl;
    if (receiver_->Start(desired->host, desired->port)) {
      active_ = desired;
      ++media_starts_;
    }
  }
}

bool ViewerSession::media_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.has_value();
}

uint64_t ViewerSession::media_starts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return media_starts_;
}

std::optional<ViewerSession::Target> ViewerSession::DesiredTarget() const {
  if (client_->phase() != control::PairingPhase::kPaired) {
    return std::nullopt;
  }
  if (client_->broadcast_on() != std::optional<bool>(true)) {
    return std::nullopt;
  }
  const auto port = client_->media_port();
  if (!port) {
    return std::nullopt;
  }
  Target target;
  target.host = client_->remote_host();
  target.port = *port;
  return target;
}

}  // namespace mirrorcast::runtime
