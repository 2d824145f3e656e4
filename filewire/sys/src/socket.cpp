#include "filewire/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include "filewire/errno-throw.hpp"
#include "filewire/log.hpp"
#include "filewire/socket-ops.hpp"

namespace filewire {

namespace {

// SOCK_CLOEXEC and SOCK_NONBLOCK type flags are Linux extensions, other systems set them with fcntl after creation.
int ComputeSocketType(Socket::Type type) {
  switch (type) {
#ifdef FILEWIRE_LINUX
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
#else
    case Socket::Type::Stream:
      [[fallthrough]];
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM;
#endif
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

void SetBoolOption(NativeHandle fd, int level, int option, const char* optionName) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, level, option, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt({}) failed for fd # {}", optionName, fd);
  }
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ComputeSocketType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
#ifndef FILEWIRE_LINUX
  if (!SetCloseOnExec(_baseFd.fd()) || (type == Type::StreamNonBlock && !SetNonBlocking(_baseFd.fd()))) {
    throw_errno("Unable to set the descriptor flags of socket fd # {}", _baseFd.fd());
  }
#endif
  SetNoSigPipe(_baseFd.fd());
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

bool Socket::tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const {
  const NativeHandle fd = _baseFd.fd();
  SetBoolOption(fd, SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
  if (reusePort) {
    SetBoolOption(fd, SOL_SOCKET, SO_REUSEPORT, "SO_REUSEPORT");
  }
  if (tcpNoDelay && !SetTcpNoDelay(fd)) {
    throw_errno("setsockopt(TCP_NODELAY) failed for fd # {}", fd);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  return ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

void Socket::bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port, int backlog) {
  if (!tryBind(reusePort, tcpNoDelay, port)) {
    throw_errno("Unable to bind socket fd # {} to port {}", _baseFd.fd(), port);
  }
  if (::listen(_baseFd.fd(), backlog) == -1) {
    throw_errno("Unable to listen on socket fd # {}", _baseFd.fd());
  }
  if (port == 0) {
    sockaddr_storage addr{};
    if (!GetLocalAddress(_baseFd.fd(), addr)) {
      throw_errno("getsockname failed for socket fd # {}", _baseFd.fd());
    }
    port = AddressPort(addr);
  }
  _boundPort = port;
  log::debug("Socket fd # {} listening on port {}", _baseFd.fd(), port);
}

}  // namespace filewire
