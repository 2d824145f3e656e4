#pragma once

#include <cstddef>
#include <cstdint>

#include "filewire/base-fd.hpp"
#include "filewire/platform.hpp"

namespace filewire {

#ifdef FILEWIRE_LINUX

// Anonymous pipe used as the kernel staging buffer of a splice(2) transfer.
class Pipe {
 public:
  // Throws std::system_error if the pipe cannot be created.
  Pipe();

  [[nodiscard]] NativeHandle readFd() const noexcept { return _readEnd.fd(); }
  [[nodiscard]] NativeHandle writeFd() const noexcept { return _writeEnd.fd(); }

 private:
  BaseFd _readEnd;
  BaseFd _writeEnd;
};

// Move up to `count` bytes from `inFd` to `outFd` with splice(2), one of them being a pipe.
// Descriptor offsets are used and advanced (no explicit offsets).
// Returns the number of bytes moved (0 at end of input) or -1 on error (errno set).
int64_t Splice(NativeHandle inFd, NativeHandle outFd, std::size_t count, bool more) noexcept;

#endif

}  // namespace filewire
