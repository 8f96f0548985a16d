// Repository: MirrorCast
// Component: Media Receiver
// Purpose: Viewer UDP endpoint: keepalives out, reassembled frames to the sink.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_MEDIA_MEDIA_RECEIVER_H_
#define MIRRORCAST_MEDIA_MEDIA_RECEIVER_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "mirrorcast/media/Frame.h"
#include "mirrorcast/media/FrameReassembler.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::media {

// Payload of the hello and keepalive datagrams. Never a valid media header.
constexpr char kKeepalivePayload[] = "MCHI!";

// MediaReceiver pulls one host's media stream.
//
// Start() sends a hello immediately and a keepalive every interval so the
// host's peer tracker keeps this viewer fresh. The receive thread is the only
// owner of the reassembler; complete frames go to the sink on that thread.
// Stop() discards any partial frame without delivering it.
class MediaReceiver {
 public:
  MediaReceiver(const runtime::MediaConfig& config,
                std::shared_ptr<timing::MasterClock> clock,
                FrameSink* sink);
  ~MediaReceiver();

  MediaReceiver(const MediaReceiver&) = delete;
  MediaReceiver& operator=(const MediaReceiver&) = delete;

  bool Start(const std::string& host, uint16_t port);
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  std::string target() const;

  ReassemblerStats stats() const;
  uint64_t keepalives_sent() const { return keepalives_sent_.load(); }

 private:
  void ReceiveLoop();
  void KeepaliveLoop();
  bool SendKeepalive();
  void PublishStats();

  const runtime::MediaConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  FrameSink* sink_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  int socket_;
  std::string target_;

  // Touched only by the receive thread while running.
  FrameReassembler reassembler_;

  std::unique_ptr<std::thread> receive_thread_;
  std::unique_ptr<std::thread> keepalive_thread_;
  std::mutex keepalive_mutex_;
  std::condition_variable keepalive_cv_;

  mutable std::mutex stats_mutex_;
  ReassemblerStats stats_;
  std::atomic<uint64_t> keepalives_sent_;
};

}  // namespace mirrorcast::media

#endif  // MIRRORCAST_MEDIA_MEDIA_RECEIVER_H_
