// Repository: MirrorCast
// Component: Peer Discovery
// Purpose: Injected source of candidate hosts; the core never browses itself.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/runtime/PeerDiscovery.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace mirrorcast::runtime {

StaticPeerDiscovery::StaticPeerDiscovery(std::vector<CandidatePeer> peers)
    : peers_(std::move(peers)) {}

std::vector<CandidatePeer> StaticPeerDiscovery::ListCandidatePeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

void StaticPeerDiscovery::SetObserver(Observer observer) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
  }
  Publish();
}

void StaticPeerDiscovery::Upsert(const CandidatePeer& peer) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&peer](const CandidatePeer& p) { return p.name == peer.name; });
    if (it == peers_.end()) {
      peers_.push_back(peer);
    } else if (*it == peer) {
      return;
    } else {
      *it = peer;
    }
  }
  Publish();
}

bool StaticPeerDiscovery::Remove(const std::string& name) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&name](const CandidatePeer& p) { return p.name == name; });
    if (it == peers_.end()) {
      return false;
    }
    peers_.erase(it);
  }
  Publish();
  return true;
}

std::optional<CandidatePeer> StaticPeerDiscovery::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& peer : peers_) {
    if (peer.name == name) {
      return peer;
    }
  }
  return std::nullopt;
}

void StaticPeerDiscovery::Publish() {
  Observer observer;
  std::vector<CandidatePeer> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = observer_;
    snapshot = peers_;
  }
  if (observer) {
    observer(snapshot);
  }
}

std::optional<CandidatePeer> ParseCandidatePeer(const std::string& text) {
  CandidatePeer peer;
  std::string endpoint = text;
  const auto eq = text.find('=');
  if (eq != std::string::npos) {
    peer.name = text.substr(0, eq);
    endpoint = text.substr(eq + 1);
  }
  const auto colon = endpoint.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) {
    return std::nullopt;
  }
  peer.host = endpoint.substr(0, colon);
  const std::string port_text = endpoint.substr(colon + 1);
  char* end = nullptr;
  const long port = std::strtol(port_text.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || port <= 0 || port > 65535) {
    return std::nullopt;
  }
  peer.port = static_cast<uint16_t>(port);
  if (peer.name.empty()) {
    peer.name = peer.host;
  }
  return peer;
}

}  // namespace mirrorcast::runtime
