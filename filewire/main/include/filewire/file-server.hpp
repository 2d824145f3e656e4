#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "filewire/connection.hpp"
#include "filewire/file-server-config.hpp"
#include "filewire/file-server-stats.hpp"
#include "filewire/socket.hpp"

namespace filewire {

// Serves one file to every client connecting to its listening port.
//
// Each accepted connection gets its own thread, owning the connection and a freshly opened FileSource.
// The thread sends the length header followed by the file content, then closes the connection.
// A failed transfer is logged and counted, it never stops the server.
//
// Threading model:
//  - run() / runUntil() block the calling thread, which performs the accept loop.
//  - stop() and stats() may be called from any thread.
//  - The accept loop exits on stop(), on the predicate given to runUntil(), or when SIGINT / SIGTERM was
//    received if SignalHandler::Enable() has been called. In-flight transfers are joined before returning.
class FileServer {
 public:
  // AsyncHandle: RAII wrapper for non-blocking server execution
  // ------------------------------------------------------------
  // Returned by startDetached() to manage the background thread running the accept loop.
  //
  // Typical usage:
  //   FileServer server(cfg);
  //   auto handle = server.startDetached();  // non-blocking
  //   // ... clients download ...
  //   handle.stop();  // or let handle destructor auto-stop
  //   handle.rethrowIfError();  // check for exceptions from the accept loop
  class AsyncHandle {
   public:
    AsyncHandle(const AsyncHandle&) = delete;
    AsyncHandle& operator=(const AsyncHandle&) = delete;

    AsyncHandle(AsyncHandle&&) noexcept = default;
    AsyncHandle& operator=(AsyncHandle&&) noexcept = default;

    ~AsyncHandle();

    // Stop the background accept loop and join the thread (blocking).
    // Safe to call multiple times; subsequent calls are no-ops.
    void stop() noexcept;

    // Rethrow any exception that occurred in the background accept loop. Call after stop().
    void rethrowIfError();

    [[nodiscard]] bool started() const noexcept { return _thread.joinable(); }

   private:
    friend class FileServer;

    AsyncHandle() noexcept = default;
    AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error);

    std::jthread _thread;
    std::shared_ptr<std::exception_ptr> _error;
  };

  // Validates the configuration, checks that the file can be opened, binds and listens.
  // Throws filewire::invalid_argument for invalid configuration, std::system_error if the file cannot be
  // opened or the listener cannot be set up.
  explicit FileServer(FileServerConfig config);

  // Transfer threads refer to the server: it can be neither copied nor moved.
  FileServer(const FileServer&) = delete;
  FileServer(FileServer&&) = delete;
  FileServer& operator=(const FileServer&) = delete;
  FileServer& operator=(FileServer&&) = delete;

  ~FileServer();

  // Effective listening port (useful with an ephemeral port).
  [[nodiscard]] uint16_t port() const noexcept { return _listenSocket.boundPort(); }

  [[nodiscard]] const FileServerConfig& config() const noexcept { return _config; }

  // Run the accept loop until stop() is called or a termination signal is received.
  void run();

  // Like run(), but also exits when 'predicate' returns true (checked at least once per poll interval).
  void runUntil(const std::function<bool()>& predicate);

  // Run the accept loop in a background thread owned by the server, stopped by stop() or destruction.
  void start();

  // Run the accept loop in a background thread owned by the returned handle.
  [[nodiscard]] AsyncHandle startDetached();

  // Request the accept loop to exit. Blocking only if the loop was launched by start().
  void stop() noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

  [[nodiscard]] FileServerStats stats() const noexcept { return _stats.snapshot(); }

 private:
  struct Worker {
    std::jthread thread;
    std::atomic<bool> done{false};
  };

  void acceptPending();

  void launchTransfer(Connection cnx);

  void transfer(Connection cnx) noexcept;

  void reapFinishedWorkers();

  void waitForFreeSlot();

  void waitBeforeAcceptRetry();

  void joinAllWorkers();

  [[nodiscard]] bool atCapacity() const noexcept;

  FileServerConfig _config;
  Socket _listenSocket;
  std::list<Worker> _workers;
  std::mutex _workersDoneMutex;
  std::condition_variable _workerDone;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
  internal::AtomicFileServerStats _stats;
  AsyncHandle _internalHandle;
};

}  // namespace filewire
