#include "psdconv/child-process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "psdconv/base-fd.hpp"
#include "psdconv/log.hpp"
#include "psdconv/socket-ops.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

namespace {

// Upper bound of a single poll wait so that the child exit is detected even if a descendant keeps the pipe open.
constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kExitPollSlice{5};

pid_t WaitPid(pid_t pid, int& status, int options) {
  while (true) {
    const pid_t ret = ::waitpid(pid, &status, options);
    if (ret != -1 || errno != EINTR) {
      return ret;
    }
  }
}

void FillExitStatus(int status, ProcessResult& result) {
  if (WIFEXITED(status)) {
    result.status = ProcessResult::Status::Exited;
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.status = ProcessResult::Status::Signaled;
    result.signalNumber = WTERMSIG(status);
  }
}

// Appends what is currently readable from fd to output, capped to the maximum captured size.
// Returns false when the pipe reached EOF or failed.
bool DrainPipe(int fd, std::string& output) {
  char buf[4096];
  while (true) {
    const auto nbRead = ::read(fd, buf, sizeof(buf));
    if (nbRead > 0) {
      const auto room = ChildProcess::kMaxCapturedOutput - output.size();
      output.append(buf, std::min(room, static_cast<std::size_t>(nbRead)));
      continue;
    }
    if (nbRead == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

[[noreturn]] void ExecChild(char* const* argv, int outFd, int execErrFd) {
  ::setpgid(0, 0);
  const int devNull = ::open("/dev/null", O_RDONLY);
  if (devNull != -1) {
    ::dup2(devNull, STDIN_FILENO);
  }
  ::dup2(outFd, STDOUT_FILENO);
  ::dup2(outFd, STDERR_FILENO);
  ::execvp(argv[0], argv);
  const int err = errno;
  [[maybe_unused]] const auto nbWritten = ::write(execErrFd, &err, sizeof(err));
  ::_exit(127);
}

}  // namespace

std::string_view ProcessResult::statusStr() const noexcept {
  switch (status) {
    case Status::Exited:
      return "exited";
    case Status::Signaled:
      return "signaled";
    case Status::TimedOut:
      return "timed out";
    case Status::LaunchFailed:
      return "launch failed";
    default:
      return "unknown";
  }
}

ProcessResult ChildProcess::Run(std::span<const std::string> argv, std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw std::invalid_argument("ChildProcess::Run requires at least a program name");
  }

  ProcessResult result;

  int outPipe[2];
  if (::pipe2(outPipe, O_CLOEXEC) != 0) {
    result.launchErrno = errno;
    log::error("pipe2 failed: {}", std::strerror(result.launchErrno));
    return result;
  }
  BaseFd outRead(outPipe[0]);
  BaseFd outWrite(outPipe[1]);

  int execPipe[2];
  if (::pipe2(execPipe, O_CLOEXEC) != 0) {
    result.launchErrno = errno;
    log::error("pipe2 failed: {}", std::strerror(result.launchErrno));
    return result;
  }
  BaseFd execRead(execPipe[0]);
  BaseFd execWrite(execPipe[1]);

  // No allocation is allowed between fork and exec.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1U);
  for (const std::string& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  const auto deadline = SteadyClock::now() + timeout;

  const pid_t pid = ::fork();
  if (pid == -1) {
    result.launchErrno = errno;
    log::error("fork failed: {}", std::strerror(result.launchErrno));
    return result;
  }
  if (pid == 0) {
    ExecChild(cargv.data(), outWrite.fd(), execWrite.fd());
  }

  // Also set from the parent so that a kill on the group cannot race with the child's own setpgid.
  ::setpgid(pid, pid);
  outWrite.close();
  execWrite.close();

  int status = 0;
  int childErrno = 0;
  ssize_t nbRead;
  do {
    nbRead = ::read(execRead.fd(), &childErrno, sizeof(childErrno));
  } while (nbRead == -1 && errno == EINTR);
  if (nbRead == static_cast<ssize_t>(sizeof(childErrno))) {
    WaitPid(pid, status, 0);
    result.status = ProcessResult::Status::LaunchFailed;
    result.launchErrno = childErrno;
    log::warn("Unable to execute '{}': {}", argv.front(), std::strerror(childErrno));
    return result;
  }

  if (!SetNonBlocking(outRead.fd())) {
    log::warn("Unable to set output pipe of pid {} non blocking", pid);
  }

  bool outputOpen = true;
  bool reaped = false;
  while (true) {
    if (!reaped && WaitPid(pid, status, WNOHANG) == pid) {
      reaped = true;
    }
    if (reaped) {
      if (outputOpen) {
        DrainPipe(outRead.fd(), result.output);
      }
      FillExitStatus(status, result);
      return result;
    }

    const auto now = SteadyClock::now();
    if (now >= deadline) {
      log::warn("Process {} '{}' exceeded its deadline of {} ms, killing its process group", pid, argv.front(),
                timeout.count());
      ::kill(-pid, SIGKILL);
      WaitPid(pid, status, 0);
      result.status = ProcessResult::Status::TimedOut;
      return result;
    }

    const auto slice =
        std::min(kPollSlice, std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    if (outputOpen) {
      pollfd pfd{outRead.fd(), POLLIN, 0};
      const int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
      if (rc > 0) {
        outputOpen = DrainPipe(outRead.fd(), result.output);
      } else if (rc == -1 && errno != EINTR) {
        log::error("poll failed on output of pid {}: {}", pid, std::strerror(errno));
        outputOpen = false;
      }
    } else {
      // Output closed, the child is about to exit.
      ::poll(nullptr, 0, static_cast<int>(std::min(slice, kExitPollSlice).count()));
    }
  }
}

}  // namespace psdconv
