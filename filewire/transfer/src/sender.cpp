#include "filewire/sender.hpp"

#include <cstdint>
#include <system_error>

#include "filewire/file-source.hpp"
#include "filewire/frame-header.hpp"
#include "filewire/log.hpp"
#include "filewire/stream.hpp"
#include "filewire/transfer-error.hpp"

namespace filewire {

std::uint64_t Sender::send(FileSource& source, Writer& conn) {
  std::uint64_t length;
  try {
    length = source.remaining();
  } catch (const std::system_error& ex) {
    log::debug("Size query of '{}' failed: {}", source.name(), ex.what());
    ThrowTransferError(TransferErrc::SourceMetadata, ex.code().value(), "unable to determine the payload size of '{}'",
                       source.name());
  }

  const FrameHeaderBytes header = EncodeLength(length);
  const IoResult wr = conn.write(header);
  if (wr.status != IoStatus::Ok) {
    ThrowTransferError(wr.status == IoStatus::Timeout ? TransferErrc::Timeout : TransferErrc::HeaderWrite, wr.err,
                       "header write stopped after {} of {} bytes", wr.bytes, kFrameHeaderSize);
  }
  log::debug("Header sent for '{}', sending {} payload bytes with the {} strategy", source.name(), length,
             _strategy->name());

  return _strategy->copyExact(conn, source, length);
}

}  // namespace filewire
