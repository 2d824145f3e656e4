#include "filewire/file-server.hpp"

#include <poll.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "filewire/connection.hpp"
#include "filewire/errno-throw.hpp"
#include "filewire/exception.hpp"
#include "filewire/file-server-config.hpp"
#include "filewire/file-source.hpp"
#include "filewire/log.hpp"
#include "filewire/sender.hpp"
#include "filewire/signal-handler.hpp"
#include "filewire/socket-ops.hpp"
#include "filewire/socket.hpp"
#include "filewire/units-parser.hpp"

namespace filewire {

FileServer::AsyncHandle::AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error)
    : _thread(std::move(thread)), _error(std::move(error)) {}

FileServer::AsyncHandle::~AsyncHandle() { stop(); }

void FileServer::AsyncHandle::stop() noexcept {
  if (_thread.joinable()) {
    _thread.request_stop();
    _thread.join();
  }
}

void FileServer::AsyncHandle::rethrowIfError() {
  if (_error && *_error) {
    std::rethrow_exception(*_error);
  }
}

FileServer::FileServer(FileServerConfig config)
    : _config(std::move(config)), _listenSocket(Socket::Type::StreamNonBlock) {
  _config.validate();

  // Refuse to start with a file that cannot be served (missing, unreadable, not a regular file).
  const FileSource probe(_config.filePath);
  const auto fileSize = probe.size();

  _listenSocket.bindAndListen(_config.reusePort, _config.tcpNoDelay, _config.port, _config.listenBacklog);
  log::info("Serving '{}' ({} bytes) on port {}", _config.filePath, fileSize, _config.port);
}

FileServer::~FileServer() {
  stop();
  joinAllWorkers();
}

void FileServer::run() {
  runUntil([] { return false; });
}

void FileServer::runUntil(const std::function<bool()>& predicate) {
  if (_running.exchange(true, std::memory_order_acq_rel)) {
    throw exception("FileServer is already running");
  }
  const int pollTimeoutMs = static_cast<int>(_config.pollInterval.count());
  try {
    while (!_stopRequested.load(std::memory_order_acquire) && !SignalHandler::IsStopRequested() && !predicate()) {
      reapFinishedWorkers();
      if (atCapacity()) {
        waitForFreeSlot();
        continue;
      }
      pollfd pfd{_listenSocket.fd(), POLLIN, 0};
      const int nbReady = ::poll(&pfd, 1, pollTimeoutMs);
      if (nbReady == -1) {
        if (errno == EINTR) {
          continue;
        }
        throw_errno("poll failed on listening socket fd # {}", _listenSocket.fd());
      }
      if (nbReady != 0) {
        acceptPending();
      }
    }
  } catch (...) {
    joinAllWorkers();
    _running.store(false, std::memory_order_release);
    throw;
  }
  log::debug("Accept loop exiting, waiting for {} in-flight transfer(s)", _workers.size());
  joinAllWorkers();
  _stopRequested.store(false, std::memory_order_release);
  _running.store(false, std::memory_order_release);
}

void FileServer::start() { _internalHandle = startDetached(); }

FileServer::AsyncHandle FileServer::startDetached() {
  auto errorPtr = std::make_shared<std::exception_ptr>();

  return {std::jthread([this, errorPtr](const std::stop_token& st) {
            try {
              runUntil([&st]() { return st.stop_requested(); });
            } catch (...) {
              *errorPtr = std::current_exception();
            }
          }),
          std::move(errorPtr)};
}

void FileServer::stop() noexcept {
  if (_running.load(std::memory_order_acquire)) {
    log::debug("Stopping server on port {}", _config.port);
    _stopRequested.store(true, std::memory_order_release);
    _workerDone.notify_all();
  }
  _internalHandle.stop();
}

bool FileServer::atCapacity() const noexcept {
  return _config.maxConcurrentTransfers != 0 && _workers.size() >= _config.maxConcurrentTransfers;
}

void FileServer::acceptPending() {
  while (!atCapacity()) {
    Connection cnx(_listenSocket);
    if (cnx) {
      launchTransfer(std::move(cnx));
      continue;
    }
    switch (cnx.acceptError()) {
      case EAGAIN:
        return;
      case EINTR:
        [[fallthrough]];
      case ECONNABORTED:
        // the pending connection vanished before being accepted, try the next one
        continue;
      default:
        // EMFILE, ENFILE, ENOBUFS, ENOMEM: the pending connection stays in the backlog and the listener stays
        // readable, so wait before polling again.
        waitBeforeAcceptRetry();
        return;
    }
  }
}

void FileServer::launchTransfer(Connection cnx) {
  _stats.onAccepted();
  const auto workerIt = _workers.emplace(_workers.end());
  try {
    workerIt->thread = std::jthread([this, &worker = *workerIt, cnx = std::move(cnx)]() mutable {
      transfer(std::move(cnx));
      {
        std::scoped_lock lock(_workersDoneMutex);
        worker.done.store(true, std::memory_order_release);
      }
      _workerDone.notify_all();
    });
  } catch (const std::system_error& ex) {
    // the connection was moved into the discarded thread state and is already closed
    _workers.erase(workerIt);
    _stats.onFailed();
    log::error("Unable to start a transfer thread: {}", ex.what());
  }
}

void FileServer::transfer(Connection cnx) noexcept {
  const std::string peer = PeerAddressString(cnx.fd());
  try {
    if (_config.transfer.ioTimeout.count() != 0 && !cnx.setTimeouts(_config.transfer.ioTimeout)) {
      throw_errno("Unable to set the I/O timeout of connection fd # {}", cnx.fd());
    }
    FileSource source(_config.filePath);
    Sender sender(_config.transfer);

    log::debug("Transfer of '{}' to {} started", _config.filePath, peer);
    const auto startTime = std::chrono::steady_clock::now();
    const uint64_t nbBytes = sender.send(source, cnx);
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);

    _stats.onCompleted(nbBytes);
    log::info("Sent {} bytes ({}) to {} in {} ms", nbBytes, BytesToStr(nbBytes, 2), peer, elapsed.count());
  } catch (const std::exception& ex) {
    _stats.onFailed();
    log::error("Transfer to {} failed: {}", peer, ex.what());
  }
}

void FileServer::reapFinishedWorkers() {
  std::erase_if(_workers, [](const Worker& worker) { return worker.done.load(std::memory_order_acquire); });
}

void FileServer::waitForFreeSlot() {
  std::unique_lock lock(_workersDoneMutex);
  _workerDone.wait_for(lock, _config.pollInterval, [this] {
    if (_stopRequested.load(std::memory_order_acquire)) {
      return true;
    }
    for (const Worker& worker : _workers) {
      if (worker.done.load(std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  });
}

void FileServer::waitBeforeAcceptRetry() {
  std::unique_lock lock(_workersDoneMutex);
  _workerDone.wait_for(lock, _config.pollInterval, [this] { return _stopRequested.load(std::memory_order_acquire); });
}

void FileServer::joinAllWorkers() {
  // jthread destructor joins
  _workers.clear();
}

}  // namespace filewire
