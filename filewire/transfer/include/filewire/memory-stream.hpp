#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

#include "filewire/stream.hpp"

namespace filewire {

// Reader over a caller owned memory buffer. It exposes no descriptor, so kernel fast paths never apply to it.
class MemoryReader : public Reader {
 public:
  // 'maxChunk' caps the number of bytes returned by a single read (0 = no cap).
  explicit MemoryReader(std::span<const std::byte> data, std::size_t maxChunk = 0) noexcept
      : _data(data), _maxChunk(maxChunk) {}

  explicit MemoryReader(std::string_view data, std::size_t maxChunk = 0) noexcept
      : MemoryReader(std::as_bytes(std::span<const char>(data.data(), data.size())), maxChunk) {}

  IoResult read(std::span<std::byte> dst) override;

  [[nodiscard]] std::size_t consumed() const noexcept { return _pos; }

  [[nodiscard]] std::size_t remaining() const noexcept { return _data.size() - _pos; }

 private:
  std::span<const std::byte> _data;
  std::size_t _pos{0};
  std::size_t _maxChunk;
};

// Writer appending into an owned growable buffer.
class MemoryWriter : public Writer {
 public:
  static constexpr std::size_t kUnlimited = std::numeric_limits<std::size_t>::max();

  // Writes beyond 'capacity' bytes fail with ENOSPC, after the bytes fitting in have been stored.
  explicit MemoryWriter(std::size_t capacity = kUnlimited) noexcept : _capacity(capacity) {}

  IoResult write(std::span<const std::byte> src) override;

  [[nodiscard]] std::span<const std::byte> data() const noexcept { return _buf; }

  [[nodiscard]] std::string_view view() const noexcept {
    return {reinterpret_cast<const char*>(_buf.data()), _buf.size()};
  }

  [[nodiscard]] std::size_t size() const noexcept { return _buf.size(); }

  void clear() noexcept { _buf.clear(); }

 private:
  std::vector<std::byte> _buf;
  std::size_t _capacity;
};

}  // namespace filewire
