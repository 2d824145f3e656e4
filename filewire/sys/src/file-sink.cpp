#include "filewire/file-sink.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <span>
#include <utility>

#include "filewire/errno-throw.hpp"
#include "filewire/fd-io.hpp"
#include "filewire/log.hpp"

namespace filewire {

namespace {

int Flags(FileSink::OpenMode mode) {
  switch (mode) {
    case FileSink::OpenMode::Truncate:
      return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    case FileSink::OpenMode::Exclusive:
      return O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

}  // namespace

FileSink::FileSink(const char* path, OpenMode mode, mode_t permissions)
    : _fd(::open(path, Flags(mode), permissions)), _path(path) {
  if (!_fd) {
    throw_errno("Unable to create file '{}'", path);
  }
  struct stat st{};
  _isRegular = ::fstat(_fd.fd(), &st) == 0 && S_ISREG(st.st_mode);
  log::debug("FileSink fd # {} opened for '{}'", _fd.fd(), _path);
}

IoResult FileSink::write(std::span<const std::byte> src) { return WriteAllFd(_fd.fd(), src); }

StreamBacking FileSink::backing() const noexcept {
  return _isRegular ? StreamBacking::RegularFile : StreamBacking::Other;
}

void FileSink::sync() {
  while (::fsync(_fd.fd()) != 0) {
    if (errno != EINTR) {
      throw_errno("fsync failed for '{}'", _path);
    }
  }
}

}  // namespace filewire
