#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace psdconv {

struct ProcessResult {
  enum class Status : std::uint8_t {
    // The process ran to completion, exitCode is valid.
    Exited,
    // The process was terminated by a signal it did not expect (signalNumber is valid).
    Signaled,
    // The deadline expired, the whole process group was killed and reaped.
    TimedOut,
    // The process could not be started (launchErrno is valid).
    LaunchFailed
  };

  [[nodiscard]] bool success() const noexcept { return status == Status::Exited && exitCode == 0; }

  [[nodiscard]] std::string_view statusStr() const noexcept;

  Status status{Status::LaunchFailed};
  int exitCode{-1};
  int signalNumber{0};
  int launchErrno{0};
  // Interleaved stdout + stderr of the child, truncated to ChildProcess::kMaxCapturedOutput bytes.
  std::string output;
};

// Runs an external program to completion with a wall-clock deadline.
//
// The child is started in its own process group (setpgid) with stdin redirected to /dev/null and both stdout and
// stderr captured through a pipe. When the deadline expires the whole group receives SIGKILL and is reaped before
// Run returns, so no descendant outlives the call. The program is looked up in PATH (execvp semantics).
class ChildProcess {
 public:
  static constexpr std::size_t kMaxCapturedOutput = 64UL * 1024UL;

  ChildProcess() noexcept = delete;

  // argv[0] is the program name. Never throws for process-level failures: they are reported in the result.
  // Throws std::invalid_argument if argv is empty.
  static ProcessResult Run(std::span<const std::string> argv, std::chrono::milliseconds timeout);
};

}  // namespace psdconv
