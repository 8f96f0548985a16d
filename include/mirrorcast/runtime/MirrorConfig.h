// Repository: MirrorCast
// Component: Mirror Configuration
// Purpose: Recognized options for the host and viewer, with their defaults.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_RUNTIME_MIRROR_CONFIG_H_
#define MIRRORCAST_RUNTIME_MIRROR_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace mirrorcast::runtime {

constexpr uint16_t kDefaultControlPort = 52345;

struct ControlConfig {
  std::string bind_host = "0.0.0.0";
  uint16_t port = kDefaultControlPort;  // 0 binds an ephemeral port
  std::size_t code_length = 4;
  int64_t heartbeat_interval_ms = 5'000;
  int heartbeat_misses = 3;
  int64_t handshake_timeout_ms = 8'000;
  int64_t connect_timeout_ms = 3'000;
  int64_t broadcast_poll_ms = 1'000;
  bool auto_accept = false;
};

struct MediaConfig {
  std::string bind_host = "0.0.0.0";
  uint16_t relay_port = 0;  // 0 binds an ephemeral port
  std::size_t mtu = 1200;
  int64_t freshness_ms = 6'000;
  int64_t keepalive_interval_ms = 2'000;
  int64_t sweep_interval_ms = 1'000;
};

struct MirrorConfig {
  ControlConfig control;
  MediaConfig media;

  // Host
  int admin_port = 50061;     // 0 disables the admin service
  int metrics_port = 9308;    // 0 disables the metrics endpoint
  std::string broadcast_file;  // empty keeps the flag in memory
  bool broadcast_on = false;
  bool test_stream = false;
  int test_stream_fps = 30;

  // Viewer
  std::string host = "127.0.0.1";
  std::string peer_name = "host";
  std::string code;  // empty generates one
};

}  // namespace mirrorcast::runtime

#endif  // MIRRORCAST_RUNTIME_MIRROR_CONFIG_H_
