// Repository: MirrorCast
// Component: Peer Tracker
// Purpose: Track the single freshest destination for outbound media.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_MEDIA_PEER_TRACKER_H_
#define MIRRORCAST_MEDIA_PEER_TRACKER_H_

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace mirrorcast::media {

constexpr int64_t kDefaultPeerFreshnessUs = 6'000'000;

struct PeerAddress {
  std::string host;
  uint16_t port = 0;
  int64_t last_seen_utc_us = 0;

  bool SameEndpoint(const std::string& other_host, uint16_t other_port) const {
    return host == other_host && port == other_port;
  }

  std::string ToString() const { return host + ":" + std::to_string(port); }
};

// PeerTracker holds at most one active media peer.
//
// - Refresh() from a keepalive updates last_seen; a different address replaces
//   the tracked peer immediately (most recently seen wins).
// - Sweep() clears the peer once it has not been refreshed for the freshness
//   window; forwarding halts until the next keepalive.
//
// Thread Model:
// - All methods are serialized on an internal mutex.
// - The change callback runs after the mutex is released, on the caller's
//   thread.
class PeerTracker {
 public:
  using PeerChangedCallback = std::function<void(const std::optional<PeerAddress>&)>;

  explicit PeerTracker(int64_t freshness_window_us = kDefaultPeerFreshnessUs);

  PeerTracker(const PeerTracker&) = delete;
  PeerTracker& operator=(const PeerTracker&) = delete;

  void SetPeerChangedCallback(PeerChangedCallback callback);

  // Records a keepalive from host:port. Returns true if the tracked peer changed.
  bool Refresh(const std::string& host, uint16_t port, int64_t now_utc_us);

  // Clears the peer if it is stale at now_utc_us. Returns true if cleared.
  bool Sweep(int64_t now_utc_us);

  // Returns the tracked peer if it is still fresh at now_utc_us.
  std::optional<PeerAddress> ActivePeer(int64_t now_utc_us) const;

  // Unconditionally forgets the tracked peer.
  void Clear();

  int64_t freshness_window_us() const { return freshness_window_us_; }
  uint64_t peer_changes() const;

 private:
  bool IsFreshLocked(int64_t now_utc_us) const;
  void Notify(const std::optional<PeerAddress>& peer);

  const int64_t freshness_window_us_;

  mutable std::mutex mutex_;
  std::optional<PeerAddress> peer_;
  uint64_t peer_changes_;
  PeerChangedCallback callback_;
};

}  // namespace mirrorcast::media

#endif  // MIRRORCAST_MEDIA_PEER_TRACKER_H_
