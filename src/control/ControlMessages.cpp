// Repository: MirrorCast
// Component: Control Message Codec
// Purpose: Newline-delimited JSON control messages and line framing.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/control/ControlMessages.h"

#include <limits>

#include <nlohmann/json.hpp>

#include "mirrorcast/common/Overloaded.h"

namespace mirrorcast::control {

using json = nlohmann::json;

namespace {

std::optional<uint16_t> ReadPort(const json& value) {
  if (!value.is_number_integer()) {
    return std::nullopt;
  }
  const auto port = value.get<int64_t>();
  if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(port);
}

std::optional<ControlMessage> DecodeHandshakeRequest(const json& j) {
  if (!j["app"].is_string() || !j.contains("ver") || !j["ver"].is_number_integer() ||
      !j.contains("role") || !j["role"].is_string() || !j.contains("code") ||
      !j["code"].is_string()) {
    return std::nullopt;
  }
  HandshakeRequest req;
  req.app = j["app"].get<std::string>();
  req.ver = j["ver"].get<int64_t>();
  req.role = j["role"].get<std::string>();
  req.code = j["code"].get<std::string>();
  return req;
}

std::optional<ControlMessage> DecodeHandshakeResponse(const json& j) {
  if (!j["ok"].is_boolean()) {
    return std::nullopt;
  }
  HandshakeResponse resp;
  resp.ok = j["ok"].get<bool>();
  if (j.contains("sessionID")) {
    if (!j["sessionID"].is_string()) {
      return std::nullopt;
    }
    resp.session_id = j["sessionID"].get<std::string>();
  }
  if (j.contains("udpPort")) {
    resp.udp_port = ReadPort(j["udpPort"]);
    if (!resp.udp_port) {
      return std::nullopt;
    }
  }
  if (j.contains("message")) {
    if (!j["message"].is_string()) {
      return std::nullopt;
    }
    resp.message = j["message"].get<std::string>();
  }
  if (resp.ok && !resp.session_id) {
    return std::nullopt;
  }
  return resp;
}

}  // namespace

std::string EncodeMessage(const ControlMessage& message) {
  json j = std::visit(
      Overloaded{
          [](const HandshakeRequest& m) {
            return json{{"app", m.app}, {"ver", m.ver}, {"role", m.role}, {"code", m.code}};
          },
          [](const HandshakeResponse& m) {
            json out{{"ok", m.ok}};
            if (m.session_id) {
              out["sessionID"] = *m.session_id;
            }
            if (m.udp_port) {
              out["udpPort"] = *m.udp_port;
            }
            if (m.message) {
              out["message"] = *m.message;
            }
            return out;
          },
          [](const Heartbeat&) { return json{{"hb", 1}}; },
          [](const BroadcastStatus& m) { return json{{"on", m.on}}; },
          [](const MediaParams& m) { return json{{"udpPort", m.udp_port}}; },
      },
      message);
  std::string line = j.dump();
  line.push_back('\n');
  return line;
}

std::optional<ControlMessage> DecodeMessage(const std::string& line) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::exception&) {
    return std::nullopt;
  }
  if (!j.is_object()) {
    return std::nullopt;
  }

  if (j.contains("hb")) {
    return Heartbeat{};
  }
  if (j.contains("app")) {
    return DecodeHandshakeRequest(j);
  }
  if (j.contains("ok")) {
    return DecodeHandshakeResponse(j);
  }
  if (j.contains("on")) {
    if (!j["on"].is_boolean()) {
      return std::nullopt;
    }
    return BroadcastStatus{j["on"].get<bool>()};
  }
  if (j.contains("udpPort")) {
    const auto port = ReadPort(j["udpPort"]);
    if (!port) {
      return std::nullopt;
    }
    return MediaParams{*port};
  }
  return std::nullopt;
}

const char* MessageName(const ControlMessage& message) {
  return std::visit(
      Overloaded{
          [](const HandshakeRequest&) { return "HandshakeRequest"; },
          [](const HandshakeResponse&) { return "HandshakeResponse"; },
          [](const Heartbeat&) { return "Heartbeat"; },
          [](const BroadcastStatus&) { return "BroadcastStatus"; },
          [](const MediaParams&) { return "MediaParams"; },
      },
      message);
}

LineBuffer::LineBuffer(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes), overflowed_(false) {}

bool LineBuffer::Append(const char* data, std::size_t size) {
  if (overflowed_) {
    return false;
  }
  buffer_.append(data, size);
  const auto newline = buffer_.rfind('\n');
  const std::size_t partial = newline == std::string::npos ? buffer_.size()
                                                           : buffer_.size() - newline - 1;
  if (partial > max_line_bytes_) {
    overflowed_ = true;
    buffer_.clear();
    return false;
  }
  return true;
}

bool LineBuffer::NextLine(std::string& line) {
  while (true) {
    const auto newline = buffer_.find('\n');
    if (newline == std::string::npos) {
      return false;
    }
    line.assign(buffer_, 0, newline);
    buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      return true;
    }
  }
}

}  // namespace mirrorcast::control
