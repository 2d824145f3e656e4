#pragma once

namespace filewire {

// Process-wide SIGINT / SIGTERM hook. Accept loops poll IsStopRequested() between two waits
// and stop accepting new connections once a termination signal was received.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM, and ignores SIGPIPE so that writes to a closed peer
  // surface as EPIPE instead of killing the process.
  static void Enable();

  // Restores default behavior for SIGINT, SIGTERM and SIGPIPE.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested() noexcept;

 private:
  friend class SignalHandlerTest;

  // Resets the stop-requested flag so that several tests can run in the same process.
  static void ResetStopRequest() noexcept;
};

}  // namespace filewire
