// Repository: MirrorCast
// Component: Error Taxonomy
// Purpose: Failure categories shared by the control and media paths.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_COMMON_ERROR_KIND_H_
#define MIRRORCAST_COMMON_ERROR_KIND_H_

namespace mirrorcast {

// ErrorKind classifies every failure the core can observe.
//
// - kTransport:       connect/send/receive failed. Surfaced, never retried.
// - kProtocol:        malformed or unexpected control message. Connection closed.
// - kMalformedHeader: bad media datagram. Dropped and counted.
// - kTimeout:         heartbeat or handshake wait expired.
// - kConfiguration:   MTU too small for header + config blob.
enum class ErrorKind {
  kTransport = 0,
  kProtocol = 1,
  kMalformedHeader = 2,
  kTimeout = 3,
  kConfiguration = 4,
};

inline const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTransport:
      return "transport error";
    case ErrorKind::kProtocol:
      return "protocol error";
    case ErrorKind::kMalformedHeader:
      return "malformed header";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kConfiguration:
      return "configuration error";
  }
  return "unknown";
}

}  // namespace mirrorcast

#endif  // MIRRORCAST_COMMON_ERROR_KIND_H_
