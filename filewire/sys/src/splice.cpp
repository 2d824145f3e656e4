#include "filewire/splice.hpp"

#include "filewire/platform.hpp"

#ifdef FILEWIRE_LINUX

#include <fcntl.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>

#include "filewire/errno-throw.hpp"
#include "filewire/log.hpp"

namespace filewire {

namespace {
struct PipeEnds {
  int fds[2]{kInvalidHandle, kInvalidHandle};
};

PipeEnds CreatePipe() {
  PipeEnds ends;
  if (::pipe2(ends.fds, O_CLOEXEC) == -1) {
    throw_errno("Unable to create a pipe");
  }
  return ends;
}
}  // namespace

Pipe::Pipe() {
  const PipeEnds ends = CreatePipe();
  _readEnd = BaseFd(ends.fds[0]);
  _writeEnd = BaseFd(ends.fds[1]);
  log::debug("Pipe opened with read fd # {} and write fd # {}", ends.fds[0], ends.fds[1]);
}

int64_t Splice(NativeHandle inFd, NativeHandle outFd, std::size_t count, bool more) noexcept {
  unsigned int flags = SPLICE_F_MOVE;
  if (more) {
    flags |= SPLICE_F_MORE;
  }
  return static_cast<int64_t>(::splice(inFd, nullptr, outFd, nullptr, count, flags));
}

}  // namespace filewire

#endif
