#include "filewire/socket-ops.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "filewire/platform.hpp"

namespace filewire {

namespace {

bool SetTimeoutOption(NativeHandle fd, int option, std::chrono::milliseconds timeout) noexcept {
  timeval tv{};
  if (timeout.count() > 0) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(secs.count());
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>(
        std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs).count());
  }
  return ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}

}  // namespace

bool SetCloseOnExec(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFD, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

bool SetNonBlocking(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetNoSigPipe(NativeHandle fd) noexcept {
#ifdef FILEWIRE_MACOS
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &kEnable, sizeof(kEnable)) == 0;
#else
  // Linux uses MSG_NOSIGNAL per-send.
  (void)fd;
  return true;
#endif
}

bool SetTcpNoDelay(NativeHandle fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

bool SetRecvTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept {
  return SetTimeoutOption(fd, SO_RCVTIMEO, timeout);
}

bool SetSendTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept {
  return SetTimeoutOption(fd, SO_SNDTIMEO, timeout);
}

int GetSocketError(NativeHandle fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return errno;
  }
  return err;
}

bool GetLocalAddress(NativeHandle fd, sockaddr_storage& addr) noexcept {
  socklen_t len = sizeof(addr);
  return ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
}

bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept {
  socklen_t len = sizeof(addr);
  return ::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
}

uint16_t AddressPort(const sockaddr_storage& addr) noexcept {
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

std::string FormatAddress(const sockaddr_storage& addr) {
  std::array<char, INET6_ADDRSTRLEN> buf{};
  const void* src = nullptr;
  if (addr.ss_family == AF_INET) {
    src = &reinterpret_cast<const sockaddr_in*>(&addr)->sin_addr;
  } else if (addr.ss_family == AF_INET6) {
    src = &reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_addr;
  } else {
    return "?";
  }
  if (::inet_ntop(addr.ss_family, src, buf.data(), static_cast<socklen_t>(buf.size())) == nullptr) {
    return "?";
  }
  std::string ret(buf.data());
  if (addr.ss_family == AF_INET6) {
    ret.insert(ret.begin(), '[');
    ret.push_back(']');
  }
  ret.push_back(':');
  ret.append(std::to_string(AddressPort(addr)));
  return ret;
}

std::string PeerAddressString(NativeHandle fd) {
  sockaddr_storage addr{};
  if (!GetPeerAddress(fd, addr)) {
    return "?";
  }
  return FormatAddress(addr);
}

int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept {
#ifdef FILEWIRE_LINUX
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
#else
  // macOS uses SO_NOSIGPIPE socket option (set at socket creation) instead of MSG_NOSIGNAL.
  return static_cast<int64_t>(::send(fd, data, len, 0));
#endif
}

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace filewire
