#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "filewire/platform.hpp"

namespace filewire {

// What a stream is backed by. Copy strategies inspect it to decide whether a kernel fast path
// (sendfile / splice) can be used between two streams.
enum class StreamBacking : std::uint8_t {
  Other,        // anything without an exposed descriptor: memory buffers, user-space TLS, test doubles
  RegularFile,  // a regular file descriptor (seekable, stat-able)
  Socket        // a connected stream socket descriptor
};

enum class IoStatus : std::uint8_t {
  Ok,       // requested operation made progress
  Eof,      // orderly end of stream (read only)
  Timeout,  // SO_RCVTIMEO / SO_SNDTIMEO deadline expired before any progress
  Error     // fatal error, 'err' holds the errno value
};

struct IoResult {
  std::size_t bytes{0};  // bytes read or written before the status was reached
  IoStatus status{IoStatus::Ok};
  int err{0};  // errno when status is Error or Timeout
};

std::string_view IoStatusToString(IoStatus status) noexcept;

// Sequential source of bytes.
class Reader {
 public:
  virtual ~Reader() = default;

  // Blocking read of at most dst.size() bytes.
  // Returns {n > 0, Ok} on progress, {0, Eof} at end of stream, or {0, Timeout/Error}.
  // EINTR is retried internally.
  virtual IoResult read(std::span<std::byte> dst) = 0;

  [[nodiscard]] virtual StreamBacking backing() const noexcept { return StreamBacking::Other; }

  // Raw descriptor usable by kernel fast paths, kInvalidHandle if the stream does not expose one.
  [[nodiscard]] virtual NativeHandle nativeHandle() const noexcept { return kInvalidHandle; }
};

// Sequential sink of bytes.
class Writer {
 public:
  virtual ~Writer() = default;

  // Blocking write of the whole buffer. Partial writes are continued internally, so a result with
  // status Ok always has bytes == src.size(). On Timeout / Error, bytes holds what was written before.
  virtual IoResult write(std::span<const std::byte> src) = 0;

  [[nodiscard]] virtual StreamBacking backing() const noexcept { return StreamBacking::Other; }

  [[nodiscard]] virtual NativeHandle nativeHandle() const noexcept { return kInvalidHandle; }
};

// Capability probes. A stream qualifies only if it also exposes its descriptor.
template <class Stream>
[[nodiscard]] bool IsFileBacked(const Stream& stream) noexcept {
  return stream.backing() == StreamBacking::RegularFile && stream.nativeHandle() != kInvalidHandle;
}

template <class Stream>
[[nodiscard]] bool IsSocketBacked(const Stream& stream) noexcept {
  return stream.backing() == StreamBacking::Socket && stream.nativeHandle() != kInvalidHandle;
}

}  // namespace filewire
