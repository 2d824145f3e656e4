#include "filewire/sendfile.hpp"

#include <sys/types.h>

#include <cstddef>
#include <cstdint>

#include "filewire/platform.hpp"

#ifdef FILEWIRE_LINUX
#include <sys/sendfile.h>
#elifdef FILEWIRE_MACOS
#include <sys/socket.h>
#include <sys/uio.h>
#endif

namespace filewire {

int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept {
#ifdef FILEWIRE_LINUX
  static_assert(sizeof(ssize_t) <= sizeof(int64_t), "ssize_t must fit in int64_t");
  return static_cast<int64_t>(::sendfile(outFd, inFd, &offset, count));
#elifdef FILEWIRE_MACOS
  auto len = static_cast<off_t>(count);
  const int rc = ::sendfile(inFd, outFd, offset, &len, nullptr, 0);
  if (rc == -1 && len == 0) {
    return -1;
  }
  offset += len;
  return static_cast<int64_t>(len);
#endif
}

}  // namespace filewire
