#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "filewire/platform.hpp"
#include "filewire/stream.hpp"
#include "filewire/transfer-config.hpp"

namespace filewire {

// Moves the payload of a transfer from a Reader to a Writer.
// Strategies hold per-transfer state (buffers) and are not thread safe: use one instance per transfer.
class CopyStrategy {
 public:
  virtual ~CopyStrategy() = default;

  // Move exactly 'n' bytes from 'src' to 'dst' and return the number of bytes moved, which is always 'n'.
  // Throws TransferError: PayloadTruncated if 'src' ends before 'n' bytes, Timeout if a deadline expired,
  // DescriptorUnavailable if the streams do not support the strategy, IO otherwise.
  // Bytes already moved when an error occurs stay in 'dst'.
  virtual std::uint64_t copyExact(Writer& dst, Reader& src, std::uint64_t n) = 0;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// read / write loop through a user-space buffer of fixed size, allocated at first use.
class ChunkedCopy final : public CopyStrategy {
 public:
  explicit ChunkedCopy(std::size_t chunkSize, std::string_view name = "buffered") noexcept
      : _chunkSize(chunkSize), _name(name) {}

  std::uint64_t copyExact(Writer& dst, Reader& src, std::uint64_t n) override;

  [[nodiscard]] std::string_view name() const noexcept override { return _name; }

  [[nodiscard]] std::size_t chunkSize() const noexcept { return _chunkSize; }

 private:
  std::vector<std::byte> _buffer;
  std::size_t _chunkSize;
  std::string_view _name;
};

// Kernel file to socket copy with sendfile(2), starting at the current offset of the source file.
// On return (also on error), the source offset is positioned after the bytes sent.
class SendfileCopy final : public CopyStrategy {
 public:
  std::uint64_t copyExact(Writer& dst, Reader& src, std::uint64_t n) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "sendfile"; }
};

#ifdef FILEWIRE_LINUX
// Kernel socket to file copy with splice(2), staging the bytes in a pipe.
class SpliceCopy final : public CopyStrategy {
 public:
  explicit SpliceCopy(std::size_t chunkSize) noexcept : _chunkSize(chunkSize) {}

  std::uint64_t copyExact(Writer& dst, Reader& src, std::uint64_t n) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "splice"; }

 private:
  std::size_t _chunkSize;
};
#endif

// Selects, for each copy, the fastest strategy supported by the two streams:
//  - sendfile from a regular file to a socket
//  - splice from a socket to a regular file (Linux)
//  - buffered copy in all other cases
class AutoCopy final : public CopyStrategy {
 public:
  explicit AutoCopy(std::size_t bufferSize);

  std::uint64_t copyExact(Writer& dst, Reader& src, std::uint64_t n) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "auto"; }

  // Strategy that copyExact would use for these streams.
  [[nodiscard]] CopyStrategy& select(const Writer& dst, const Reader& src) noexcept;

 private:
  ChunkedCopy _buffered;
  SendfileCopy _sendfile;
#ifdef FILEWIRE_LINUX
  SpliceCopy _splice;
#endif
};

// Build the strategy described by 'config'.
std::unique_ptr<CopyStrategy> MakeCopyStrategy(const TransferConfig& config);

}  // namespace filewire
