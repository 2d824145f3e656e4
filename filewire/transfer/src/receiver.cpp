#include "filewire/receiver.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "filewire/copy-strategy.hpp"
#include "filewire/frame-header.hpp"
#include "filewire/log.hpp"
#include "filewire/stream.hpp"
#include "filewire/transfer-config.hpp"
#include "filewire/transfer-error.hpp"

namespace filewire {

namespace {
std::unique_ptr<CopyStrategy> MakeReceiveStrategy(const TransferConfig& config) {
  if (config.strategy == CopyStrategyKind::Sendfile) {
    return MakeCopyStrategy(TransferConfig(config).withStrategy(CopyStrategyKind::Auto));
  }
  return MakeCopyStrategy(config);
}
}  // namespace

Receiver::Receiver(const TransferConfig& config) : Receiver(MakeReceiveStrategy(config)) {}

std::uint64_t Receiver::readHeader(Reader& conn) {
  FrameHeaderBytes header;
  std::size_t received = 0;
  while (received < kFrameHeaderSize) {
    const IoResult rd = conn.read(std::span<std::byte>(header).subspan(received));
    switch (rd.status) {
      case IoStatus::Ok:
        received += rd.bytes;
        break;
      case IoStatus::Eof:
        ThrowTransferError(TransferErrc::HeaderTruncated, 0, "end of stream after {} of {} header bytes", received,
                           kFrameHeaderSize);
      case IoStatus::Timeout:
        ThrowTransferError(TransferErrc::Timeout, rd.err, "header read timed out after {} of {} bytes", received,
                           kFrameHeaderSize);
      default:
        ThrowTransferError(TransferErrc::IO, rd.err, "header read failed after {} of {} bytes", received,
                           kFrameHeaderSize);
    }
  }
  return DecodeLength(header);
}

std::uint64_t Receiver::receive(Reader& conn, Writer& sink) {
  const std::uint64_t length = readHeader(conn);
  log::debug("Header received, expecting {} payload bytes ({} strategy)", length, _strategy->name());
  if (length == 0) {
    return 0;
  }
  return _strategy->copyExact(sink, conn, length);
}

}  // namespace filewire
