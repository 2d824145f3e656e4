#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace filewire {

// How payload bytes are moved between the two ends of a transfer.
enum class CopyStrategyKind : std::uint8_t {
  // Kernel fast path when both ends allow it (sendfile from a file to a socket, splice from a socket to a file),
  // buffered copy otherwise.
  Auto,
  // User-space copy with a buffer of TransferConfig::bufferSize bytes.
  Buffered,
  // User-space copy with a fixed 1 KiB buffer.
  SmallChunk,
  // sendfile(2) only. Fails with DescriptorUnavailable if the source is not a file or the destination not a socket.
  Sendfile
};

// Parse "auto", "buffered", "small" or "sendfile". Throws filewire::invalid_argument on other values.
CopyStrategyKind CopyStrategyKindFromString(std::string_view name);

std::string_view CopyStrategyKindToString(CopyStrategyKind kind) noexcept;

struct TransferConfig {
  static constexpr std::size_t kDefaultBufferSize = 64UL * 1024;
  static constexpr std::size_t kSmallChunkSize = 1024;
  static constexpr std::size_t kMaxBufferSize = 1UL << 30;

  // Payload copy strategy. Default: Auto.
  CopyStrategyKind strategy{CopyStrategyKind::Auto};

  // Chunk size of the buffered copy, also used as the maximum amount of bytes moved per splice(2) call.
  // Default: 64 KiB.
  std::size_t bufferSize{kDefaultBufferSize};

  // Receive / send deadline installed on the connection of each transfer. 0 (default) waits forever.
  std::chrono::milliseconds ioTimeout{0};

  // Validates config. Throws filewire::invalid_argument if it is not valid.
  void validate() const;

  TransferConfig& withStrategy(CopyStrategyKind kind) {
    strategy = kind;
    return *this;
  }

  TransferConfig& withBufferSize(std::size_t size) {
    bufferSize = size;
    return *this;
  }

  TransferConfig& withIoTimeout(std::chrono::milliseconds timeout) {
    ioTimeout = timeout;
    return *this;
  }

  bool operator==(const TransferConfig&) const noexcept = default;
};

}  // namespace filewire
