#include <filewire/filewire.hpp>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>

#include "filewire/safe-cast.hpp"
#include "filewire/units-parser.hpp"

using namespace filewire;

namespace {

void PrintUsage(const char *prog) {
  std::cerr << "Usage: " << prog
            << " [--port N] [--strategy auto|buffered|small|sendfile] [--buffer-size SIZE] [--timeout-ms MS]"
               " [--max-transfers N] [--log-level LEVEL] <file>\n";
}

template <class T>
bool ParseInteger(std::string_view str, T &value) {
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), value);
  return errc == std::errc{} && ptr == str.data() + str.size();
}

// Parse a byte size such as "64Ki" into a transfer buffer size.
bool ParseBufferSize(std::string_view str, std::size_t &value) {
  try {
    value = SafeCast<std::size_t>(ParseNumberOfBytes(str));
  } catch (const std::exception &) {
    return false;
  }
  return value != 0;
}

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 3000;
  uint32_t maxTransfers = 0;
  int64_t timeoutMs = 0;
  std::string_view strategy = "auto";
  std::size_t bufferSize = 0;
  std::string_view logLevel = "info";
  std::string_view filePath;

  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    const bool hasValue = argPos + 1 < argc;
    bool ok = true;
    if (arg == "--port" && hasValue) {
      ok = ParseInteger(argv[++argPos], port);
    } else if (arg == "--strategy" && hasValue) {
      strategy = argv[++argPos];
    } else if (arg == "--buffer-size" && hasValue) {
      ok = ParseBufferSize(argv[++argPos], bufferSize);
    } else if (arg == "--timeout-ms" && hasValue) {
      ok = ParseInteger(argv[++argPos], timeoutMs) && timeoutMs >= 0;
    } else if (arg == "--max-transfers" && hasValue) {
      ok = ParseInteger(argv[++argPos], maxTransfers);
    } else if (arg == "--log-level" && hasValue) {
      logLevel = argv[++argPos];
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return EXIT_SUCCESS;
    } else if (!arg.starts_with("--") && filePath.empty()) {
      filePath = arg;
    } else {
      ok = false;
    }
    if (!ok) {
      std::cerr << "Invalid argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return EXIT_FAILURE;
    }
  }
  if (filePath.empty()) {
    PrintUsage(argv[0]);
    return EXIT_FAILURE;
  }

  const auto level = LogLevelFromString(logLevel);
  if (!level) {
    std::cerr << "Invalid log level: " << logLevel << "\n";
    return EXIT_FAILURE;
  }
  log::set_level(*level);

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  try {
    TransferConfig transferConfig;
    transferConfig.withStrategy(CopyStrategyKindFromString(strategy))
        .withIoTimeout(std::chrono::milliseconds{timeoutMs});
    if (bufferSize != 0) {
      transferConfig.withBufferSize(bufferSize);
    }

    FileServer server(FileServerConfig{}
                          .withPort(port)
                          .withFilePath(filePath)
                          .withMaxConcurrentTransfers(maxTransfers)
                          .withTransferConfig(transferConfig));
    server.run();  // blocking run, until Ctrl+C

    const FileServerStats stats = server.stats();
    log::info("Served {} transfer(s), {} failed, {} payload bytes", stats.completedTransfers, stats.failedTransfers,
              stats.payloadBytesSent);
  } catch (const std::exception &e) {
    log::critical("Server encountered error: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
