#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "filewire/transfer-config.hpp"

namespace filewire {

struct FileServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, retrievable with FileServer::port().
  uint16_t port{0};
  // Enable SO_REUSEPORT on the listening socket. Default: false.
  bool reusePort{false};
  // Enable TCP_NODELAY on the listening socket (inherited by accepted connections). Default: false.
  bool tcpNoDelay{false};
  // listen(2) backlog. Connections beyond maxConcurrentTransfers wait there. Default: 128.
  int listenBacklog{128};

  // ============================
  // Served content
  // ============================
  // File sent to every client. It is reopened for each transfer, so that content changes are picked up
  // and transfers never share a file offset.
  std::string filePath;

  // ============================
  // Scheduling
  // ============================
  // Upper bound of the time the accept loop waits before checking stop requests (stop(), SIGINT, SIGTERM).
  // Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};
  // Maximum number of transfers running at the same time, each in its own thread. 0 (default) means unlimited.
  uint32_t maxConcurrentTransfers{0};

  // Per transfer options (copy strategy, buffer size, I/O timeout).
  TransferConfig transfer;

  // Validates config. Throws filewire::invalid_argument if it is not valid.
  void validate() const;

  FileServerConfig& withPort(uint16_t portValue) {
    port = portValue;
    return *this;
  }

  FileServerConfig& withReusePort(bool on = true) {
    reusePort = on;
    return *this;
  }

  FileServerConfig& withTcpNoDelay(bool on = true) {
    tcpNoDelay = on;
    return *this;
  }

  FileServerConfig& withListenBacklog(int backlog) {
    listenBacklog = backlog;
    return *this;
  }

  FileServerConfig& withFilePath(std::string_view path) {
    filePath = path;
    return *this;
  }

  FileServerConfig& withPollInterval(std::chrono::milliseconds interval) {
    pollInterval = interval;
    return *this;
  }

  FileServerConfig& withMaxConcurrentTransfers(uint32_t maxTransfers) {
    maxConcurrentTransfers = maxTransfers;
    return *this;
  }

  FileServerConfig& withTransferConfig(const TransferConfig& config) {
    transfer = config;
    return *this;
  }

  bool operator==(const FileServerConfig&) const noexcept = default;
};

}  // namespace filewire
