#include "filewire/file-client.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "filewire/connection.hpp"
#include "filewire/errno-throw.hpp"
#include "filewire/file-client-config.hpp"
#include "filewire/file-sink.hpp"
#include "filewire/log.hpp"
#include "filewire/receiver.hpp"
#include "filewire/tcp-connector.hpp"
#include "filewire/units-parser.hpp"

namespace filewire {

namespace {

Connection Dial(const FileClientConfig& config) {
  ConnectResult res = ConnectTCP(config.host, config.port, config.family);
  if (res.failure) {
    const std::error_code ec = res.err == 0 ? std::make_error_code(std::errc::host_unreachable)
                                            : std::error_code(res.err, std::generic_category());
    throw std::system_error(ec, fmt::format("Unable to connect to {}:{}", config.host, config.port));
  }
  if (config.transfer.ioTimeout.count() != 0 && !res.cnx.setTimeouts(config.transfer.ioTimeout)) {
    throw_errno("Unable to set the I/O timeout of connection fd # {}", res.cnx.fd());
  }
  return std::move(res.cnx);
}

void RemovePartialFile(const std::string& path) noexcept {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    log::error("Unable to remove partial file '{}': {}", path, ec.message());
  }
}

}  // namespace

FileClient::FileClient(FileClientConfig config) : _config(std::move(config)) { _config.validate(); }

DownloadResult FileClient::download() {
  Connection cnx = Dial(_config);
  log::debug("Connected to {}:{}", _config.host, _config.port);

  const std::string receivingPath = _config.receivingPath();
  FileSink sink(receivingPath);
  Receiver receiver(_config.transfer);

  const auto startTime = std::chrono::steady_clock::now();
  DownloadResult result;
  try {
    result.payloadBytes = receiver.receive(cnx, sink);
    if (_config.atomic) {
      sink.sync();
      sink.close();
      std::filesystem::rename(receivingPath, _config.outputPath);
    }
  } catch (...) {
    if (_config.atomic) {
      sink.close();
      RemovePartialFile(receivingPath);
    }
    throw;
  }
  result.elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);

  log::info("Received {} bytes ({}) into '{}' in {} ms", result.payloadBytes, BytesToStr(result.payloadBytes, 2),
            _config.outputPath, result.elapsed.count());
  return result;
}

}  // namespace filewire
