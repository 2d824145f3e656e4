#include "filewire/fd-io.hpp"

#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <span>

#include "filewire/socket-ops.hpp"

namespace filewire {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {

IoResult FailureResult(std::size_t bytesDone, int err) noexcept {
  return IoResult{bytesDone, err == EAGAIN ? IoStatus::Timeout : IoStatus::Error, err};
}

template <class WriteFn>
IoResult WriteLoop(std::span<const std::byte> src, WriteFn writeFn) noexcept {
  IoResult ret;
  while (ret.bytes < src.size()) {
    const auto nbWritten = writeFn(src.data() + ret.bytes, src.size() - ret.bytes);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      return FailureResult(ret.bytes, errno);
    }
    ret.bytes += static_cast<std::size_t>(nbWritten);
  }
  return ret;
}

}  // namespace

IoResult ReadFd(NativeHandle fd, std::span<std::byte> dst) noexcept {
  while (true) {
    const auto nbRead = ::read(fd, dst.data(), dst.size());
    if (nbRead > 0) {
      return IoResult{static_cast<std::size_t>(nbRead), IoStatus::Ok, 0};
    }
    if (nbRead == 0) {
      return IoResult{0, dst.empty() ? IoStatus::Ok : IoStatus::Eof, 0};
    }
    if (errno == EINTR) {
      continue;
    }
    return FailureResult(0, errno);
  }
}

IoResult WriteAllFd(NativeHandle fd, std::span<const std::byte> src) noexcept {
  return WriteLoop(src, [fd](const std::byte* data, std::size_t len) { return ::write(fd, data, len); });
}

IoResult SendAll(NativeHandle fd, std::span<const std::byte> src) noexcept {
  return WriteLoop(src, [fd](const std::byte* data, std::size_t len) { return SafeSend(fd, data, len); });
}

int64_t CurrentOffset(NativeHandle fd) noexcept { return static_cast<int64_t>(::lseek(fd, 0, SEEK_CUR)); }

bool SeekTo(NativeHandle fd, int64_t offset) noexcept {
  return ::lseek(fd, static_cast<off_t>(offset), SEEK_SET) != static_cast<off_t>(-1);
}

}  // namespace filewire
