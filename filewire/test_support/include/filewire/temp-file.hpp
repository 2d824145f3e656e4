#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace filewire::test {

// Unique temporary directory under the system temp directory, removed (with its content) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "filewire-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Path of a (not created) entry named 'name' inside this directory.
  [[nodiscard]] std::filesystem::path entry(std::string_view name) const { return _dir / name; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// Temporary file created inside an existing ScopedTempDir and removed on destruction.
// The content written to disk is kept in memory for comparisons.
class ScopedTempFile {
 public:
  // Create a file with the given content.
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  // Create a file of 'size' pseudo-random bytes (deterministic for a given seed).
  ScopedTempFile(const ScopedTempDir& dir, std::uint64_t size, std::uint64_t seed = 42);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

}  // namespace filewire::test
