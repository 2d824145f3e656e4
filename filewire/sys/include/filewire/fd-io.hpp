#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "filewire/platform.hpp"
#include "filewire/stream.hpp"

namespace filewire {

// Blocking descriptor I/O loops shared by the file and socket streams.
// EINTR is always retried. EAGAIN / EWOULDBLOCK on a blocking descriptor only happens when a
// SO_RCVTIMEO / SO_SNDTIMEO deadline expired; it is reported as IoStatus::Timeout.

// Single read(2) of at most dst.size() bytes.
IoResult ReadFd(NativeHandle fd, std::span<std::byte> dst) noexcept;

// write(2) until the whole buffer is consumed or an error occurs.
IoResult WriteAllFd(NativeHandle fd, std::span<const std::byte> src) noexcept;

// send(2) until the whole buffer is consumed or an error occurs. Never raises SIGPIPE.
IoResult SendAll(NativeHandle fd, std::span<const std::byte> src) noexcept;

// Current file offset of 'fd', or -1 on error (errno set).
int64_t CurrentOffset(NativeHandle fd) noexcept;

// Move the file offset of 'fd' to the absolute position 'offset'. Returns true on success.
bool SeekTo(NativeHandle fd, int64_t offset) noexcept;

}  // namespace filewire
