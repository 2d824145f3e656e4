#include "filewire/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "filewire/log.hpp"

namespace filewire {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  int ret;
  do {
    ret = ::close(_fd);
  } while (ret == -1 && errno == EINTR);
  if (ret == -1) {
    // EBADF only happens if the descriptor was closed behind our back, nothing left to release.
    log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
  } else {
    log::debug("fd # {} closed", _fd);
  }
  _fd = kClosedFd;
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace filewire
