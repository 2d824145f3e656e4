#pragma once

#include <sys/types.h>  // off_t

#include <cstddef>
#include <cstdint>

#include "filewire/platform.hpp"

namespace filewire {

// Platform-abstracted sendfile.
// Transfers up to `count` bytes from file descriptor `inFd` (at `offset`)
// to socket `outFd`. On success, `offset` is advanced by the number of
// bytes actually sent. The file offset of `inFd` itself is not modified.
//
// Returns the number of bytes transferred (>= 0) or -1 on error (errno set).
//
// Linux: wraps sendfile(2) with its native signature.
// macOS: wraps sendfile(2) with the macOS signature (arguments reversed, len is in/out).
int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept;

}  // namespace filewire
