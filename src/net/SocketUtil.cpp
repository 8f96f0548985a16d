// Repository: MirrorCast
// Component: Socket Utilities
// Purpose: Thin POSIX socket helpers shared by the control and media paths.
// Copyright (c) 2025 MirrorCast

#include "mirrorcast/net/SocketUtil.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace mirrorcast::net {

namespace {

bool SetBlocking(int fd, bool blocking) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int updated = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(fd, F_SETFL, updated) == 0;
}

void SetTimeoutOption(int fd, int option, int64_t timeout_ms) {
  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(timeout_ms / 1'000);
  timeout.tv_usec = static_cast<suseconds_t>((timeout_ms % 1'000) * 1'000);
  if (setsockopt(fd, SOL_SOCKET, option, &timeout, sizeof(timeout)) < 0) {
    std::cerr << "[SocketUtil] setsockopt timeout failed: " << std::strerror(errno)
              << std::endl;
  }
}

}  // namespace

bool ResolveIPv4(const std::string& host, uint16_t port, sockaddr_in* out) {
  std::memset(out, 0, sizeof(*out));
  out->sin_family = AF_INET;
  out->sin_port = htons(port);
  if (host.empty() || host == "0.0.0.0") {
    out->sin_addr.s_addr = htonl(INADDR_ANY);
    return true;
  }
  if (inet_pton(AF_INET, host.c_str(), &out->sin_addr) == 1) {
    return true;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  addrinfo* result = nullptr;
  if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
    return false;
  }
  out->sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
  freeaddrinfo(result);
  return true;
}

std::string HostOf(const sockaddr_in& addr) {
  char text[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text)) == nullptr) {
    return "?";
  }
  return text;
}

std::string FormatEndpoint(const sockaddr_in& addr) {
  return HostOf(addr) + ":" + std::to_string(ntohs(addr.sin_port));
}

bool IsLoopback(const sockaddr_in& addr) {
  return (ntohl(addr.sin_addr.s_addr) >> 24) == 127;
}

int OpenTcpListener(const std::string& bind_host, uint16_t port, uint16_t* bound_port) {
  sockaddr_in addr{};
  if (!ResolveIPv4(bind_host, port, &addr)) {
    std::cerr << "[SocketUtil] Cannot resolve bind host " << bind_host << std::endl;
    return kInvalidSocket;
  }

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    std::cerr << "[SocketUtil] Failed to create TCP socket: " << std::strerror(errno)
              << std::endl;
    return kInvalidSocket;
  }
  int opt = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::cerr << "[SocketUtil] Failed to bind TCP port " << port << ": "
              << std::strerror(errno) << std::endl;
    close(fd);
    return kInvalidSocket;
  }
  if (listen(fd, 16) < 0) {
    std::cerr << "[SocketUtil] Failed to listen: " << std::strerror(errno) << std::endl;
    close(fd);
    return kInvalidSocket;
  }

  if (bound_port != nullptr) {
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);
    *bound_port = ntohs(bound.sin_port);
  }
  return fd;
}

int ConnectTcp(const std::string& host, uint16_t port, int64_t timeout_ms, std::string* error) {
  sockaddr_in addr{};
  if (!ResolveIPv4(host, port, &addr)) {
    if (error != nullptr) {
      *error = "cannot resolve " + host;
    }
    return kInvalidSocket;
  }

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    if (error != nullptr) {
      *error = std::strerror(errno);
    }
    return kInvalidSocket;
  }

  SetBlocking(fd, false);
  int rc = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (rc < 0 && errno != EINPROGRESS) {
    if (error != nullptr) {
      *error = std::strerror(errno);
    }
    close(fd);
    return kInvalidSocket;
  }

  if (rc < 0) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (rc <= 0) {
      if (error != nullptr) {
        *error = rc == 0 ? "connect timeout" : std::strerror(errno);
      }
      close(fd);
      return kInvalidSocket;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (so_error != 0) {
      if (error != nullptr) {
        *error = std::strerror(so_error);
      }
      close(fd);
      return kInvalidSocket;
    }
  }

  SetBlocking(fd, true);
  return fd;
}

int OpenUdpSocket(const std::string& bind_host, uint16_t port, uint16_t* bound_port) {
  sockaddr_in addr{};
  if (!ResolveIPv4(bind_host, port, &addr)) {
    std::cerr << "[SocketUtil] Cannot resolve bind host " << bind_host << std::endl;
    return kInvalidSocket;
  }

  int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    std::cerr << "[SocketUtil] Failed to create UDP socket: " << std::strerror(errno)
              << std::endl;
    return kInvalidSocket;
  }
  if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::cerr << "[SocketUtil] Failed to bind UDP port " << port << ": "
              << std::strerror(errno) << std::endl;
    close(fd);
    return kInvalidSocket;
  }

  if (bound_port != nullptr) {
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);
    *bound_port = ntohs(bound.sin_port);
  }
  return fd;
}

bool SendAll(int fd, const char* data, std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

void SetReceiveTimeout(int fd, int64_t timeout_ms) {
  SetTimeoutOption(fd, SO_RCVTIMEO, timeout_ms);
}

void SetSendTimeout(int fd, int64_t timeout_ms) {
  SetTimeoutOption(fd, SO_SNDTIMEO, timeout_ms);
}

void ShutdownSocket(int fd) {
  if (fd != kInvalidSocket) {
    shutdown(fd, SHUT_RDWR);
  }
}

void CloseSocket(int& fd) {
  if (fd != kInvalidSocket) {
    close(fd);
    fd = kInvalidSocket;
  }
}

}  // namespace mirrorcast::net
