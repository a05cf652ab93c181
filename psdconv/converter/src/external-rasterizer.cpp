#include "psdconv/external-rasterizer.hpp"

#include <array>
#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "psdconv/child-process.hpp"
#include "psdconv/log.hpp"

namespace psdconv {

ExternalRasterizer::ExternalRasterizer(std::string program) : _program(std::move(program)) {
  if (_program.empty()) {
    throw std::invalid_argument("Rasterizer program cannot be empty");
  }
}

bool ExternalRasterizer::rasterize(const std::filesystem::path& input, const std::filesystem::path& output,
                                   std::chrono::milliseconds timeout) {
  ProcessResult result;
  try {
    const std::array<std::string, 3> argv{_program, input.string() + "[0]", output.string()};
    result = ChildProcess::Run(argv, timeout);
  } catch (const std::exception& ex) {
    log::error("Unable to run {} on {}: {}", _program, input.string(), ex.what());
    return false;
  }

  switch (result.status) {
    case ProcessResult::Status::Exited:
      if (result.exitCode == 0) {
        log::debug("Converted {} into {}", input.string(), output.string());
        return true;
      }
      log::error("Error converting {}: {} exited with code {}: {}", input.string(), _program, result.exitCode,
                 result.output);
      break;
    case ProcessResult::Status::Signaled:
      log::error("Error converting {}: {} killed by signal {}: {}", input.string(), _program, result.signalNumber,
                 result.output);
      break;
    case ProcessResult::Status::TimedOut:
      log::error("Timeout converting {} after {} ms", input.string(), timeout.count());
      break;
    case ProcessResult::Status::LaunchFailed:
      log::error("Unable to launch {} to convert {}: {}", _program, input.string(),
                 std::strerror(result.launchErrno));
      break;
  }
  return false;
}

}  // namespace psdconv
