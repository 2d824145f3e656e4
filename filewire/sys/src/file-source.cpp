#include "filewire/file-source.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>

#include "filewire/errno-throw.hpp"
#include "filewire/fd-io.hpp"
#include "filewire/log.hpp"

namespace filewire {

namespace {

bool IsRegularFile(NativeHandle fd) noexcept {
  struct stat st{};
  return ::fstat(fd, &st) == 0 && S_ISREG(st.st_mode);
}

}  // namespace

FileSource::FileSource(const char* path) : _fd(::open(path, O_RDONLY | O_CLOEXEC)), _name(path) {
  if (!_fd) {
    throw_errno("Unable to open file '{}' for reading", path);
  }
  _isRegular = IsRegularFile(_fd.fd());
  log::debug("FileSource fd # {} opened for '{}'", _fd.fd(), _name);
}

FileSource::FileSource(BaseFd&& fd, std::string_view name)
    : _fd(std::move(fd)), _name(name), _isRegular(_fd && IsRegularFile(_fd.fd())) {}

std::uint64_t FileSource::size() const {
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    throw_errno("Unable to stat file '{}'", _name);
  }
  if (!S_ISREG(st.st_mode)) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                            fmt::format("'{}' is not a regular file, its size is unknown", _name));
  }
  return static_cast<std::uint64_t>(st.st_size);
}

std::uint64_t FileSource::position() const {
  const int64_t offset = CurrentOffset(_fd.fd());
  if (offset < 0) {
    throw_errno("Unable to query the offset of file '{}'", _name);
  }
  return static_cast<std::uint64_t>(offset);
}

std::uint64_t FileSource::remaining() const {
  const std::uint64_t total = size();
  const std::uint64_t pos = position();
  return pos < total ? total - pos : 0;
}

IoResult FileSource::read(std::span<std::byte> dst) { return ReadFd(_fd.fd(), dst); }

StreamBacking FileSource::backing() const noexcept {
  return _isRegular ? StreamBacking::RegularFile : StreamBacking::Other;
}

}  // namespace filewire
