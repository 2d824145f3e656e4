#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "filewire/copy-strategy.hpp"
#include "filewire/stream.hpp"
#include "filewire/transfer-config.hpp"

namespace filewire {

// Receiving side of a transfer: reads the length header, then exactly that many payload bytes.
// Bytes following the payload are left unread. A partially written sink is left as is on error.
class Receiver {
 public:
  // sendfile cannot write into a file: a Sendfile configuration receives with the Auto strategy (splice on Linux).
  explicit Receiver(const TransferConfig& config = {});

  explicit Receiver(std::unique_ptr<CopyStrategy> strategy) noexcept : _strategy(std::move(strategy)) {}

  // Read the 8 bytes header and return the announced payload length.
  // Throws TransferError HeaderTruncated if the stream ends before, Timeout or IO on read failure.
  std::uint64_t readHeader(Reader& conn);

  // Receive one transfer into 'sink' and return the payload length.
  // Throws TransferError: header errors (see readHeader), PayloadTruncated if the stream ends before the
  // announced length, or any other copy strategy error.
  std::uint64_t receive(Reader& conn, Writer& sink);

  [[nodiscard]] CopyStrategy& strategy() noexcept { return *_strategy; }

 private:
  std::unique_ptr<CopyStrategy> _strategy;
};

}  // namespace filewire
