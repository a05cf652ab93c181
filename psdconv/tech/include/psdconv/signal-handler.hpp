#pragma once

namespace psdconv {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request graceful shutdown.
  // Throws std::system_error if a handler cannot be installed.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Number of the last termination signal received, 0 if none.
  static int StopSignal();

  // Resets the stop-requested flag, allowing several runs in the same process.
  static void ResetStopRequest();
};

}  // namespace psdconv
