// Repository: MirrorCast
// Component: Socket Utilities
// Purpose: Thin POSIX socket helpers shared by the control and media paths.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_NET_SOCKET_UTIL_H_
#define MIRRORCAST_NET_SOCKET_UTIL_H_

#include <netinet/in.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace mirrorcast::net {

constexpr int kInvalidSocket = -1;

// Resolves an IPv4 host name or dotted quad.
bool ResolveIPv4(const std::string& host, uint16_t port, sockaddr_in* out);

std::string FormatEndpoint(const sockaddr_in& addr);
std::string HostOf(const sockaddr_in& addr);
bool IsLoopback(const sockaddr_in& addr);

// Binds and listens. Writes the bound port (useful when port == 0).
int OpenTcpListener(const std::string& bind_host, uint16_t port, uint16_t* bound_port);

// Connects with a bounded wait. Returns kInvalidSocket and fills `error` on
// failure; the returned socket is blocking.
int ConnectTcp(const std::string& host, uint16_t port, int64_t timeout_ms, std::string* error);

// Binds a UDP socket. Writes the bound port.
int OpenUdpSocket(const std::string& bind_host, uint16_t port, uint16_t* bound_port);

// Writes the whole buffer. Returns false on any send failure.
bool SendAll(int fd, const char* data, std::size_t size);

// Bounds blocking recv/recvfrom so reader loops can observe stop flags.
void SetReceiveTimeout(int fd, int64_t timeout_ms);

// Bounds blocking send so a peer that stops reading fails SendAll instead
// of stalling the sender.
void SetSendTimeout(int fd, int64_t timeout_ms);

// Wakes a thread blocked on `fd` without releasing the descriptor.
void ShutdownSocket(int fd);

void CloseSocket(int& fd);

}  // namespace mirrorcast::net

#endif  // MIRRORCAST_NET_SOCKET_UTIL_H_
