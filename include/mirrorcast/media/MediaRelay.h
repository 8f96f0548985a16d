// Repository: MirrorCast
// Component: Media Relay
// Purpose: Host UDP endpoint that sends fragmented frames to the freshest viewer.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_MEDIA_MEDIA_RELAY_H_
#define MIRRORCAST_MEDIA_MEDIA_RELAY_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "mirrorcast/media/Frame.h"
#include "mirrorcast/media/FrameFragmenter.h"
#include "mirrorcast/media/PeerTracker.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::media {

// MediaRelay is the single media destination manager on the host.
//
// Inbound datagrams:
// - A valid media header from a loopback sender is a pre-packetized datagram
//   from a local encoder process; it is forwarded unchanged to the tracked peer.
// - Any other datagram without a valid header is a viewer keepalive and
//   refreshes the Peer Tracker.
//
// Outbound frames:
// - SubmitFrame() fragments and sends to the tracked peer. Without a fresh
//   peer the frame is counted as unsent.
//
// Thread Model:
// - Receive thread: keepalives and forwarding
// - Sweep thread: freshness sweep while armed
// - SubmitFrame() runs on the encoder's thread
// - The peer tracker and sequence counter are guarded by one mutex, so
//   fragmentation, forwarding and keepalive refresh never interleave.
class MediaRelay {
 public:
  struct Stats {
    uint64_t frames_sent = 0;
    uint64_t frames_unsent = 0;      // No fresh peer, or disarmed
    uint64_t frames_rejected = 0;    // MTU cannot carry the frame
    uint64_t datagrams_sent = 0;
    uint64_t datagrams_forwarded = 0;
    uint64_t keepalives_received = 0;
    uint64_t stray_datagrams = 0;    // Media datagrams from non-loopback senders
    uint64_t send_errors = 0;
    uint32_t next_seq = 0;
  };

  MediaRelay(const runtime::MediaConfig& config, std::shared_ptr<timing::MasterClock> clock);
  ~MediaRelay();

  MediaRelay(const MediaRelay&) = delete;
  MediaRelay& operator=(const MediaRelay&) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  uint16_t port() const { return bound_port_; }

  // Disarming halts forwarding and the freshness sweep and forgets the peer.
  void Arm();
  void Disarm();
  bool armed() const { return armed_.load(std::memory_order_acquire); }

  // Encoder push interface. Returns true if the frame went out.
  bool SubmitFrame(const Frame& frame);

  // Runs one freshness sweep at the current clock time.
  void SweepNow();

  std::optional<PeerAddress> ActivePeer() const;
  Stats stats() const;

 private:
  void ReceiveLoop();
  void SweepLoop();
  bool SendDatagramLocked(const PeerAddress& peer, const std::vector<uint8_t>& datagram);

  const runtime::MediaConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  FrameFragmenter fragmenter_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  std::atomic<bool> armed_;
  int socket_;
  uint16_t bound_port_;

  std::unique_ptr<std::thread> receive_thread_;
  std::unique_ptr<std::thread> sweep_thread_;
  std::mutex sweep_mutex_;
  std::condition_variable sweep_cv_;

  mutable std::mutex media_mutex_;
  PeerTracker tracker_;
  uint32_t seq_;
  Stats stats_;
};

}  // namespace mirrorcast::media

#endif  // MIRRORCAST_MEDIA_MEDIA_RELAY_H_
