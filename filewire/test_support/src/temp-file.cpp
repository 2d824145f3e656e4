#include "filewire/temp-file.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <span>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "filewire/base-fd.hpp"
#include "filewire/fd-io.hpp"
#include "filewire/log.hpp"
#include "filewire/test-util.hpp"

namespace filewire::test {

namespace {
std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

std::filesystem::path CreateFileWithContent(const std::filesystem::path& dir, std::string_view content) {
  // mkstemp creates and opens atomically, avoiding name races between parallel tests
  std::string tmpl = (dir / "filewire_temp_XXXXXX").string();

  BaseFd fd(::mkstemp(tmpl.data()));
  if (!fd) {
    throw std::system_error(errno, std::generic_category(), "ScopedTempFile: mkstemp failed");
  }
  std::filesystem::path path(tmpl);

  const IoResult res = WriteAllFd(fd.fd(), std::as_bytes(std::span<const char>(content.data(), content.size())));
  if (res.status != IoStatus::Ok) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    throw std::system_error(res.err, std::generic_category(), "ScopedTempFile: write failed");
  }
  return path;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / fmt::format("{}{:016x}", prefix, dist(ThreadRng()));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view content)
    : _path(CreateFileWithContent(dir.dirPath(), content)), _content(content) {}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::uint64_t size, std::uint64_t seed)
    : _content(RandomPayload(size, seed)) {
  _path = CreateFileWithContent(dir.dirPath(), _content);
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  // Only the file is removed here; the owning ScopedTempDir removes the directory.
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if (ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {}", _path.string(), ec.message());
    }
    _path.clear();
  }
}

}  // namespace filewire::test
