#pragma once

#include <atomic>
#include <cstdint>

namespace filewire {

// Snapshot of the FileServer counters.
struct FileServerStats {
  uint64_t acceptedConnections{0};
  uint64_t completedTransfers{0};
  uint64_t failedTransfers{0};
  uint64_t activeTransfers{0};
  uint64_t payloadBytesSent{0};

  bool operator==(const FileServerStats&) const noexcept = default;
};

namespace internal {

// Counters updated concurrently by the accept loop and the transfer threads.
class AtomicFileServerStats {
 public:
  void onAccepted() noexcept {
    _accepted.fetch_add(1, std::memory_order_relaxed);
    _active.fetch_add(1, std::memory_order_relaxed);
  }

  void onCompleted(uint64_t payloadBytes) noexcept {
    _payloadBytes.fetch_add(payloadBytes, std::memory_order_relaxed);
    _completed.fetch_add(1, std::memory_order_relaxed);
    _active.fetch_sub(1, std::memory_order_relaxed);
  }

  void onFailed() noexcept {
    _failed.fetch_add(1, std::memory_order_relaxed);
    _active.fetch_sub(1, std::memory_order_relaxed);
  }

  [[nodiscard]] FileServerStats snapshot() const noexcept {
    return {_accepted.load(std::memory_order_relaxed), _completed.load(std::memory_order_relaxed),
            _failed.load(std::memory_order_relaxed), _active.load(std::memory_order_relaxed),
            _payloadBytes.load(std::memory_order_relaxed)};
  }

 private:
  std::atomic<uint64_t> _accepted{0};
  std::atomic<uint64_t> _completed{0};
  std::atomic<uint64_t> _failed{0};
  std::atomic<uint64_t> _active{0};
  std::atomic<uint64_t> _payloadBytes{0};
};

}  // namespace internal

}  // namespace filewire
