// Repository: MirrorCast
// Component: Peer Tracker
// Purpose: Track the single freshest destination for outbound media.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/media/PeerTracker.h"

#include <iostream>
#include <utility>

namespace mirrorcast::media {

PeerTracker::PeerTracker(int64_t freshness_window_us)
    : freshness_window_us_(freshness_window_us),
      peer_changes_(0) {}

void PeerTracker::SetPeerChangedCallback(PeerChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
}

bool PeerTracker::Refresh(const std::string& host, uint16_t port, int64_t now_utc_us) {
  std::optional<PeerAddress> changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (peer_ && peer_->SameEndpoint(host, port)) {
      peer_->last_seen_utc_us = now_utc_us;
      return false;
    }
    PeerAddress next;
    next.host = host;
    next.port = port;
    next.last_seen_utc_us = now_utc_us;
    if (peer_) {
      std::cout << "[PeerTracker] Peer " << peer_->ToString() << " superseded by "
                << next.ToString() << std::endl;
    } else {
      std::cout << "[PeerTracker] Peer " << next.ToString() << " active" << std::endl;
    }
    peer_ = next;
    ++peer_changes_;
    changed = next;
  }
  Notify(changed);
  return true;
}

bool PeerTracker::Sweep(int64_t now_utc_us) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!peer_ || IsFreshLocked(now_utc_us)) {
      return false;
    }
    std::cout << "[PeerTracker] Peer " << peer_->ToString() << " expired after "
              << (now_utc_us - peer_->last_seen_utc_us) / 1'000 << " ms" << std::endl;
    peer_.reset();
    ++peer_changes_;
  }
  Notify(std::nullopt);
  return true;
}

std::optional<PeerAddress> PeerTracker::ActivePeer(int64_t now_utc_us) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!peer_ || !IsFreshLocked(now_utc_us)) {
    return std::nullopt;
  }
  return peer_;
}

void PeerTracker::Clear() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!peer_) {
      return;
    }
    peer_.reset();
    ++peer_changes_;
  }
  Notify(std::nullopt);
}

uint64_t PeerTracker::peer_changes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peer_changes_;
}

bool PeerTracker::IsFreshLocked(int64_t now_utc_us) const {
  return now_utc_us - peer_->last_seen_utc_us <= freshness_window_us_;
}

void PeerTracker::Notify(const std::optional<PeerAddress>& peer) {
  PeerChangedCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = callback_;
  }
  if (callback) {
    callback(peer);
  }
}

}  // namespace mirrorcast::media
