#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "filewire/platform.hpp"

namespace filewire {

// Thin wrappers centralising socket system calls so that the transfer and server layers
// never include platform networking headers directly.

// Set the close-on-exec flag on a file descriptor.
// Returns true on success.
bool SetCloseOnExec(NativeHandle fd) noexcept;

// Set O_NONBLOCK on a file descriptor. Returns true on success.
bool SetNonBlocking(NativeHandle fd) noexcept;

// Suppress SIGPIPE on a socket (macOS: SO_NOSIGPIPE).
// No-op on Linux (uses MSG_NOSIGNAL per-send).
bool SetNoSigPipe(NativeHandle fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
bool SetTcpNoDelay(NativeHandle fd) noexcept;

// Install a receive (SO_RCVTIMEO) deadline on a blocking socket. 0 disables the deadline.
bool SetRecvTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept;

// Install a send (SO_SNDTIMEO) deadline on a blocking socket. 0 disables the deadline.
// sendfile(2) and splice(2) on the socket honor it as well.
bool SetSendTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept;

// Retrieve the pending socket error (SO_ERROR).
// Returns the error code (0 means no error, >0 is errno).
int GetSocketError(NativeHandle fd) noexcept;

// Fill `addr` with the local address bound to `fd`.
bool GetLocalAddress(NativeHandle fd, sockaddr_storage& addr) noexcept;

// Fill `addr` with the remote peer address of `fd`.
bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept;

// Port of an AF_INET / AF_INET6 address in host byte order, 0 for other families.
uint16_t AddressPort(const sockaddr_storage& addr) noexcept;

// "host:port" representation of an AF_INET / AF_INET6 address, for logging.
std::string FormatAddress(const sockaddr_storage& addr);

// "host:port" of the peer of `fd`, or "?" if it cannot be queried.
std::string PeerAddressString(NativeHandle fd);

// Send data on a connected socket without raising SIGPIPE (MSG_NOSIGNAL on Linux, SO_NOSIGPIPE on macOS).
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(NativeHandle fd) noexcept;

}  // namespace filewire
