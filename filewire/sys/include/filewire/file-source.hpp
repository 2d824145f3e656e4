#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "filewire/base-fd.hpp"
#include "filewire/stream.hpp"

namespace filewire {

// Read-only file opened for transmission.
// Owns its descriptor; reads are sequential from the current file offset.
class FileSource : public Reader {
 public:
  // Default-constructed FileSource is closed.
  FileSource() noexcept = default;

  // Open a file by path (must be null-terminated). Throws std::system_error on error.
  explicit FileSource(const char* path);

  explicit FileSource(const std::string& path) : FileSource(path.c_str()) {}

  // Adopt an already opened descriptor. 'name' is only used for logging.
  FileSource(BaseFd&& fd, std::string_view name);

  // Returns true when the FileSource currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Total size of the file in bytes, queried with fstat(2) at each call.
  // Throws std::system_error if the descriptor cannot be stat-ed or is not a regular file.
  [[nodiscard]] std::uint64_t size() const;

  // Current read offset. Throws std::system_error on lseek failure.
  [[nodiscard]] std::uint64_t position() const;

  // Number of bytes left between the current offset and the end of the file.
  // Throws std::system_error like size().
  [[nodiscard]] std::uint64_t remaining() const;

  IoResult read(std::span<std::byte> dst) override;

  [[nodiscard]] StreamBacking backing() const noexcept override;

  [[nodiscard]] NativeHandle nativeHandle() const noexcept override { return _fd.fd(); }

  [[nodiscard]] const std::string& name() const noexcept { return _name; }

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
  std::string _name;
  bool _isRegular{false};
};

}  // namespace filewire
