#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "filewire/transfer-config.hpp"

namespace filewire {

struct FileClientConfig {
  static constexpr std::string_view kPartialSuffix = ".part";

  // Server to download from.
  std::string host{"localhost"};
  uint16_t port{3000};
  // Address family passed to getaddrinfo (AF_INET, AF_INET6). 0 (default) accepts any.
  int family{0};

  // Destination file, created or truncated. Default: "local.dat".
  std::string outputPath{"local.dat"};
  // When true, bytes are received into '<outputPath>.part', renamed to outputPath only once the transfer
  // succeeded and removed otherwise, so that outputPath never holds a partial file. Default: false.
  bool atomic{false};

  // Per transfer options (copy strategy, buffer size, I/O timeout).
  TransferConfig transfer;

  // Validates config. Throws filewire::invalid_argument if it is not valid.
  void validate() const;

  // Path the payload is written to while the transfer is in progress.
  [[nodiscard]] std::string receivingPath() const {
    return atomic ? outputPath + std::string(kPartialSuffix) : outputPath;
  }

  FileClientConfig& withHost(std::string_view hostName) {
    host = hostName;
    return *this;
  }

  FileClientConfig& withPort(uint16_t portValue) {
    port = portValue;
    return *this;
  }

  FileClientConfig& withFamily(int addressFamily) {
    family = addressFamily;
    return *this;
  }

  FileClientConfig& withOutputPath(std::string_view path) {
    outputPath = path;
    return *this;
  }

  FileClientConfig& withAtomic(bool on = true) {
    atomic = on;
    return *this;
  }

  FileClientConfig& withTransferConfig(const TransferConfig& config) {
    transfer = config;
    return *this;
  }

  bool operator==(const FileClientConfig&) const noexcept = default;
};

}  // namespace filewire
