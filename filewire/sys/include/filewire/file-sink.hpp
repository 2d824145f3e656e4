#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "filewire/base-fd.hpp"
#include "filewire/stream.hpp"

namespace filewire {

// Write-only destination file. Owns its descriptor.
class FileSink : public Writer {
 public:
  enum class OpenMode : std::uint8_t {
    Truncate,  // create or truncate
    Exclusive  // create, fail with EEXIST if the path already exists
  };

  static constexpr mode_t kDefaultPermissions = 0644;

  FileSink() noexcept = default;

  // Create the file at 'path' (must be null-terminated). Throws std::system_error on error.
  explicit FileSink(const char* path, OpenMode mode = OpenMode::Truncate, mode_t permissions = kDefaultPermissions);

  explicit FileSink(const std::string& path, OpenMode mode = OpenMode::Truncate,
                    mode_t permissions = kDefaultPermissions)
      : FileSink(path.c_str(), mode, permissions) {}

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  IoResult write(std::span<const std::byte> src) override;

  [[nodiscard]] StreamBacking backing() const noexcept override;

  [[nodiscard]] NativeHandle nativeHandle() const noexcept override { return _fd.fd(); }

  // Flush written data to stable storage. Throws std::system_error on failure.
  void sync();

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
  std::string _path;
  bool _isRegular{false};
};

}  // namespace filewire
