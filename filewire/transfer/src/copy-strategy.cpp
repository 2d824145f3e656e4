#include "filewire/copy-strategy.hpp"

#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>

#include "filewire/fd-io.hpp"
#include "filewire/invalid_argument_exception.hpp"
#include "filewire/log.hpp"
#include "filewire/platform.hpp"
#include "filewire/sendfile.hpp"
#include "filewire/stream.hpp"
#include "filewire/transfer-config.hpp"
#include "filewire/transfer-error.hpp"

#ifdef FILEWIRE_LINUX
#include "filewire/splice.hpp"
#endif

namespace filewire {

namespace {

// Linux sendfile(2) moves at most 0x7ffff000 bytes per call anyway.
constexpr std::uint64_t kMaxKernelCopyChunk = 0x7ffff000;

TransferErrc ErrcFromErrno(int err) noexcept { return err == EAGAIN ? TransferErrc::Timeout : TransferErrc::IO; }

TransferErrc ErrcFromStatus(IoStatus status) noexcept {
  return status == IoStatus::Timeout ? TransferErrc::Timeout : TransferErrc::IO;
}

}  // namespace

std::uint64_t ChunkedCopy::copyExact(Writer& dst, Reader& src, std::uint64_t n) {
  if (n != 0 && _buffer.empty()) {
    _buffer.resize(_chunkSize);
  }
  std::uint64_t done = 0;
  while (done < n) {
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(n - done, _buffer.size()));
    const IoResult rd = src.read(std::span<std::byte>(_buffer.data(), want));
    switch (rd.status) {
      case IoStatus::Ok:
        break;
      case IoStatus::Eof:
        ThrowTransferError(TransferErrc::PayloadTruncated, 0, "end of stream after {} of {} payload bytes", done, n);
      default:
        ThrowTransferError(ErrcFromStatus(rd.status), rd.err, "read failed after {} of {} payload bytes", done, n);
    }
    const IoResult wr = dst.write(std::span<const std::byte>(_buffer.data(), rd.bytes));
    if (wr.status != IoStatus::Ok) {
      ThrowTransferError(ErrcFromStatus(wr.status), wr.err, "write failed after {} of {} payload bytes",
                         done + wr.bytes, n);
    }
    done += rd.bytes;
  }
  return done;
}

std::uint64_t SendfileCopy::copyExact(Writer& dst, Reader& src, std::uint64_t n) {
  if (!IsFileBacked(src) || !IsSocketBacked(dst)) {
    ThrowTransferError(TransferErrc::DescriptorUnavailable, 0,
                       "sendfile needs a file backed source and a socket backed destination");
  }
  const NativeHandle inFd = src.nativeHandle();
  const NativeHandle outFd = dst.nativeHandle();

  const int64_t startOffset = CurrentOffset(inFd);
  if (startOffset < 0) {
    ThrowTransferError(TransferErrc::IO, errno, "unable to query the offset of fd # {}", inFd);
  }
  off_t offset = static_cast<off_t>(startOffset);

  // sendfile does not move the descriptor offset: leave the source positioned after the bytes sent,
  // including when leaving with an error.
  const auto syncSourceOffset = [inFd, &offset] {
    if (!SeekTo(inFd, static_cast<int64_t>(offset))) {
      log::error("Unable to move fd # {} to offset {}: {}", inFd, static_cast<int64_t>(offset),
                 SystemErrorMessage(errno));
    }
  };

  std::uint64_t done = 0;
  while (done < n) {
    const auto chunk = static_cast<std::size_t>(std::min(n - done, kMaxKernelCopyChunk));
    const int64_t sent = Sendfile(outFd, inFd, offset, chunk);
    if (sent > 0) {
      done += static_cast<std::uint64_t>(sent);
      continue;
    }
    if (sent == 0) {
      syncSourceOffset();
      ThrowTransferError(TransferErrc::PayloadTruncated, 0, "source ended after {} of {} payload bytes", done, n);
    }
    const int err = errno;
    if (err == EINTR) {
      continue;
    }
    syncSourceOffset();
    ThrowTransferError(ErrcFromErrno(err), err, "sendfile failed after {} of {} payload bytes", done, n);
  }
  if (!SeekTo(inFd, static_cast<int64_t>(offset))) {
    ThrowTransferError(TransferErrc::IO, errno, "unable to move fd # {} after the {} bytes sent", inFd, done);
  }
  return done;
}

#ifdef FILEWIRE_LINUX
std::uint64_t SpliceCopy::copyExact(Writer& dst, Reader& src, std::uint64_t n) {
  if (!IsSocketBacked(src) || !IsFileBacked(dst)) {
    ThrowTransferError(TransferErrc::DescriptorUnavailable, 0,
                       "splice needs a socket backed source and a file backed destination");
  }
  if (n == 0) {
    return 0;
  }
  const NativeHandle inFd = src.nativeHandle();
  const NativeHandle outFd = dst.nativeHandle();
  Pipe pipe;

  std::uint64_t done = 0;
  while (done < n) {
    const auto chunk = static_cast<std::size_t>(std::min({n - done, std::uint64_t{_chunkSize}, kMaxKernelCopyChunk}));
    const int64_t inPipe = Splice(inFd, pipe.writeFd(), chunk, n - done > chunk);
    if (inPipe == 0) {
      ThrowTransferError(TransferErrc::PayloadTruncated, 0, "end of stream after {} of {} payload bytes", done, n);
    }
    if (inPipe < 0) {
      const int err = errno;
      if (err == EINTR) {
        continue;
      }
      ThrowTransferError(ErrcFromErrno(err), err, "splice from socket failed after {} of {} payload bytes", done, n);
    }

    int64_t drained = 0;
    while (drained < inPipe) {
      const int64_t moved = Splice(pipe.readFd(), outFd, static_cast<std::size_t>(inPipe - drained), false);
      if (moved > 0) {
        drained += moved;
        continue;
      }
      const int err = moved < 0 ? errno : EIO;
      if (err == EINTR) {
        continue;
      }
      ThrowTransferError(TransferErrc::IO, err, "splice to file failed after {} of {} payload bytes",
                         done + static_cast<std::uint64_t>(drained), n);
    }
    done += static_cast<std::uint64_t>(inPipe);
  }
  return done;
}
#endif

AutoCopy::AutoCopy(std::size_t bufferSize)
    : _buffered(bufferSize)
#ifdef FILEWIRE_LINUX
      ,
      _splice(bufferSize)
#endif
{
}

CopyStrategy& AutoCopy::select(const Writer& dst, const Reader& src) noexcept {
  if (IsFileBacked(src) && IsSocketBacked(dst)) {
    return _sendfile;
  }
#ifdef FILEWIRE_LINUX
  if (IsSocketBacked(src) && IsFileBacked(dst)) {
    return _splice;
  }
#endif
  return _buffered;
}

std::uint64_t AutoCopy::copyExact(Writer& dst, Reader& src, std::uint64_t n) {
  CopyStrategy& strategy = select(dst, src);
  log::trace("Copying {} bytes with the {} strategy", n, strategy.name());
  return strategy.copyExact(dst, src, n);
}

std::unique_ptr<CopyStrategy> MakeCopyStrategy(const TransferConfig& config) {
  switch (config.strategy) {
    case CopyStrategyKind::Auto:
      return std::make_unique<AutoCopy>(config.bufferSize);
    case CopyStrategyKind::Buffered:
      return std::make_unique<ChunkedCopy>(config.bufferSize);
    case CopyStrategyKind::SmallChunk:
      return std::make_unique<ChunkedCopy>(TransferConfig::kSmallChunkSize, "small");
    case CopyStrategyKind::Sendfile:
      return std::make_unique<SendfileCopy>();
    default:
      throw invalid_argument("Unknown copy strategy");
  }
}

}  // namespace filewire
