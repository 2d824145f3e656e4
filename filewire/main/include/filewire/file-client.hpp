#pragma once

#include <chrono>
#include <cstdint>

#include "filewire/file-client-config.hpp"

namespace filewire {

struct DownloadResult {
  uint64_t payloadBytes{0};
  std::chrono::milliseconds elapsed{0};
};

// Downloads the file served by a FileServer: connects, receives one transfer into the output file, disconnects.
class FileClient {
 public:
  // Throws filewire::invalid_argument if the configuration is not valid.
  explicit FileClient(FileClientConfig config);

  // Perform one download.
  // Throws std::system_error if the server cannot be reached or the output file cannot be created,
  // TransferError if the transfer itself fails. Without the atomic option, a partially received file is
  // left on disk; with it, the partial file is removed and outputPath is untouched.
  DownloadResult download();

  [[nodiscard]] const FileClientConfig& config() const noexcept { return _config; }

 private:
  FileClientConfig _config;
};

}  // namespace filewire
