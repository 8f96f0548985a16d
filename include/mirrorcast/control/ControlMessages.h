// Repository: MirrorCast
// Component: Control Message Codec
// Purpose: Newline-delimited JSON control messages and line framing.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_CONTROL_CONTROL_MESSAGES_H_
#define MIRRORCAST_CONTROL_CONTROL_MESSAGES_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mirrorcast::control {

constexpr char kAppId[] = "mirrorcast";
constexpr int64_t kProtocolVersion = 1;
constexpr char kViewerRole[] = "viewer";
constexpr std::size_t kMaxControlLineBytes = 64 * 1024;

// {"app":"mirrorcast","ver":1,"role":"viewer","code":"1234"}
struct HandshakeRequest {
  std::string app = kAppId;
  int64_t ver = kProtocolVersion;  // Full JSON width, never narrowed
  std::string role = kViewerRole;
  std::string code;
};

// Accept:  {"ok":true,"sessionID":"<uuid>","udpPort":50123}
// Decline: {"ok":false,"message":"Declined"}
struct HandshakeResponse {
  bool ok = false;
  std::optional<std::string> session_id;
  std::optional<uint16_t> udp_port;
  std::optional<std::string> message;
};

// {"hb":1}
struct Heartbeat {};

// {"on":true}
struct BroadcastStatus {
  bool on = false;
};

// {"udpPort":50123}
struct MediaParams {
  uint16_t udp_port = 0;
};

using ControlMessage =
    std::variant<HandshakeRequest, HandshakeResponse, Heartbeat, BroadcastStatus, MediaParams>;

// Serializes one message as a single line, newline included.
std::string EncodeMessage(const ControlMessage& message);

// Parses one line (without its newline). Returns nullopt for malformed JSON,
// unknown shapes and mistyped fields; callers treat that as a protocol error.
std::optional<ControlMessage> DecodeMessage(const std::string& line);

const char* MessageName(const ControlMessage& message);

// LineBuffer accumulates stream bytes and yields complete lines.
//
// A trailing '\r' is stripped and blank lines are skipped. A partial line that
// grows past kMaxControlLineBytes puts the buffer in the overflowed state.
class LineBuffer {
 public:
  explicit LineBuffer(std::size_t max_line_bytes = kMaxControlLineBytes);

  // Returns false once the buffer has overflowed.
  bool Append(const char* data, std::size_t size);

  // Pops the next complete line into `line`. Returns false when none is ready.
  bool NextLine(std::string& line);

  bool overflowed() const { return overflowed_; }
  std::size_t buffered_bytes() const { return buffer_.size(); }

 private:
  std::size_t max_line_bytes_;
  std::string buffer_;
  bool overflowed_;
};

}  // namespace mirrorcast::control

#endif  // MIRRORCAST_CONTROL_CONTROL_MESSAGES_H_
