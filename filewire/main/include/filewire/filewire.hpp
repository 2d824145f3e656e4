// filewire Umbrella Header
//
// Include this single header to pull in the public API:
//   - FileServer / FileClient and their configurations
//   - Sender / Receiver, to run transfers over streams of your own
//   - copy strategies, frame header codec and TransferError
//   - stream interfaces and their file / socket / memory implementations
//
// Each re-exported header line is annotated with IWYU pragma: export.
// Include the specific individual headers instead to minimize compile time.
//
// Usage Example:
//    #include <filewire/filewire.hpp>
//    using namespace filewire;
//    int main() {
//      FileServer server(FileServerConfig{}.withPort(3000).withFilePath("data.bin"));
//      server.run();  // until SIGINT / SIGTERM with SignalHandler::Enable()
//    }
#pragma once

// IWYU pragma: begin_exports
#include "filewire/copy-strategy.hpp"
#include "filewire/file-client-config.hpp"
#include "filewire/file-client.hpp"
#include "filewire/file-server-config.hpp"
#include "filewire/file-server-stats.hpp"
#include "filewire/file-server.hpp"
#include "filewire/file-sink.hpp"
#include "filewire/file-source.hpp"
#include "filewire/frame-header.hpp"
#include "filewire/invalid_argument_exception.hpp"
#include "filewire/log.hpp"
#include "filewire/memory-stream.hpp"
#include "filewire/receiver.hpp"
#include "filewire/sender.hpp"
#include "filewire/signal-handler.hpp"
#include "filewire/stream.hpp"
#include "filewire/transfer-config.hpp"
#include "filewire/transfer-error.hpp"
// IWYU pragma: end_exports
