// Repository: MirrorCast
// Component: Peer Discovery
// Purpose: Injected source of candidate hosts; the core never browses itself.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_RUNTIME_PEER_DISCOVERY_H_
#define MIRRORCAST_RUNTIME_PEER_DISCOVERY_H_

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mirrorcast::runtime {

struct CandidatePeer {
  std::string name;
  std::string host;
  uint16_t port = 0;

  bool operator==(const CandidatePeer& other) const {
    return name == other.name && host == other.host && port == other.port;
  }
};

class PeerDiscovery {
 public:
  using Observer = std::function<void(const std::vector<CandidatePeer>&)>;

  virtual ~PeerDiscovery() = default;

  virtual std::vector<CandidatePeer> ListCandidatePeers() const = 0;

  // Observer receives the full set on every change.
  virtual void SetObserver(Observer observer) = 0;
};

// StaticPeerDiscovery holds peers supplied by configuration or tests.
class StaticPeerDiscovery : public PeerDiscovery {
 public:
  StaticPeerDiscovery() = default;
  explicit StaticPeerDiscovery(std::vector<CandidatePeer> peers);

  std::vector<CandidatePeer> ListCandidatePeers() const override;
  void SetObserver(Observer observer) override;

  // Adds or replaces by name.
  void Upsert(const CandidatePeer& peer);
  bool Remove(const std::string& name);
  std::optional<CandidatePeer> Find(const std::string& name) const;

 private:
  void Publish();

  mutable std::mutex mutex_;
  std::vector<CandidatePeer> peers_;
  Observer observer_;
};

// Parses "name=host:port" or "host:port" (name defaults to host).
std::optional<CandidatePeer> ParseCandidatePeer(const std::string& text);

}  // namespace mirrorcast::runtime

#endif  // MIRRORCAST_RUNTIME_PEER_DISCOVERY_H_
