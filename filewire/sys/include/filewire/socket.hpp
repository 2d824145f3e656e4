#pragma once

#include <cstdint>

#include "filewire/base-fd.hpp"
#include "filewire/platform.hpp"

namespace filewire {

// IPv4 TCP socket owning its descriptor, used as the listening end of a FileServer (and of loopback tests).
// Created with SOCK_CLOEXEC and with SIGPIPE suppressed; accepted peers are wrapped in Connection.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error if socket(2) fails.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Set SO_REUSEADDR (and SO_REUSEPORT / TCP_NODELAY on demand) then bind to INADDR_ANY:port.
  // A bind failure is reported by returning false with errno set, option failures throw std::system_error.
  [[nodiscard]] bool tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const;

  // tryBind + listen(2). Port 0 asks the kernel for an ephemeral port, written back into 'port'.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port, int backlog = 128);

  // Port given to the last successful bindAndListen, 0 before.
  [[nodiscard]] uint16_t boundPort() const noexcept { return _boundPort; }

  void close() noexcept {
    _baseFd.close();
    _boundPort = 0;
  }

 private:
  BaseFd _baseFd;
  uint16_t _boundPort{0};
};

}  // namespace filewire
