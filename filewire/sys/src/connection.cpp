#include "filewire/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <span>
#include <utility>

#include "filewire/base-fd.hpp"
#include "filewire/fd-io.hpp"
#include "filewire/log.hpp"
#include "filewire/platform.hpp"
#include "filewire/socket-ops.hpp"
#include "filewire/socket.hpp"

namespace filewire {

namespace {
int ComputeConnectionFd(int socketFd, int& acceptErrno) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
#ifdef FILEWIRE_LINUX
  int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
#else
  int fd = ::accept(socketFd, reinterpret_cast<sockaddr*>(&addr), &len);
  if (fd >= 0) {
    SetCloseOnExec(fd);
  }
#endif
  if (fd < 0) {
    acceptErrno = errno;  // capture errno before any other call
    if (acceptErrno == EAGAIN || acceptErrno == EWOULDBLOCK) {
      log::trace("Connection accept would block: {} - this is expected if no pending connections",
                 std::strerror(acceptErrno));
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(acceptErrno));
    }
    fd = -1;
  } else {
    log::debug("Connection fd # {} opened from {}", fd, FormatAddress(addr));
  }
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(ComputeConnectionFd(socket.fd(), _acceptErrno)) {
  if (_baseFd) {
    SetNoSigPipe(_baseFd.fd());
  }
}

Connection::Connection(BaseFd&& bd) noexcept : _baseFd(std::move(bd)) {}

IoResult Connection::read(std::span<std::byte> dst) { return ReadFd(_baseFd.fd(), dst); }

IoResult Connection::write(std::span<const std::byte> src) { return SendAll(_baseFd.fd(), src); }

bool Connection::setTimeouts(std::chrono::milliseconds timeout) noexcept {
  return SetRecvTimeout(_baseFd.fd(), timeout) && SetSendTimeout(_baseFd.fd(), timeout);
}

bool Connection::shutdownWrite() noexcept { return ShutdownWrite(_baseFd.fd()); }

}  // namespace filewire
