#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "filewire/copy-strategy.hpp"
#include "filewire/file-source.hpp"
#include "filewire/stream.hpp"
#include "filewire/transfer-config.hpp"

namespace filewire {

// Sending side of a transfer: writes the length header, then the payload.
class Sender {
 public:
  explicit Sender(const TransferConfig& config = {}) : Sender(MakeCopyStrategy(config)) {}

  explicit Sender(std::unique_ptr<CopyStrategy> strategy) noexcept : _strategy(std::move(strategy)) {}

  // Send the bytes of 'source' from its current position to its end, framed by the 8 bytes length header.
  // Exactly 8 + length bytes are written to 'conn' on success. Returns the payload length.
  // Throws TransferError:
  //  - SourceMetadata if the size of 'source' cannot be determined (nothing is written in this case)
  //  - HeaderWrite (or Timeout) if the header could not be fully written
  //  - any error of the copy strategy
  std::uint64_t send(FileSource& source, Writer& conn);

  [[nodiscard]] CopyStrategy& strategy() noexcept { return *_strategy; }

 private:
  std::unique_ptr<CopyStrategy> _strategy;
};

}  // namespace filewire
