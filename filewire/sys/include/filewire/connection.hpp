#pragma once

#include <chrono>
#include <span>

#include "filewire/base-fd.hpp"
#include "filewire/socket.hpp"
#include "filewire/stream.hpp"

namespace filewire {

// Blocking, connected TCP stream. Owns the socket descriptor and exposes it to the
// kernel fast paths through nativeHandle().
class Connection : public Reader, public Writer {
 public:
  Connection() noexcept = default;

  // Accept the next pending connection on a listening socket.
  // On failure (including EAGAIN on a non-blocking listener), the Connection is empty (operator bool false)
  // and acceptError() returns the errno of the failed accept.
  explicit Connection(const Socket& socket);

  // Construct a Connection that takes ownership of an existing fd wrapped in BaseFd.
  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // errno of the failed accept that left this Connection empty, 0 otherwise.
  [[nodiscard]] int acceptError() const noexcept { return _acceptErrno; }

  IoResult read(std::span<std::byte> dst) override;

  IoResult write(std::span<const std::byte> src) override;

  [[nodiscard]] StreamBacking backing() const noexcept override { return StreamBacking::Socket; }

  [[nodiscard]] NativeHandle nativeHandle() const noexcept override { return _baseFd.fd(); }

  // Install receive and send deadlines on the socket (0 = wait forever).
  // Returns false if the socket options could not be set.
  bool setTimeouts(std::chrono::milliseconds timeout) noexcept;

  // Signal end of stream to the peer while keeping the read half open.
  bool shutdownWrite() noexcept;

  void close() noexcept { _baseFd.close(); }

 private:
  int _acceptErrno{0};
  BaseFd _baseFd;
};

}  // namespace filewire
