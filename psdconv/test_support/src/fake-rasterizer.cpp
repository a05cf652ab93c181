#include "psdconv/fake-rasterizer.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "psdconv/file.hpp"
#include "psdconv/log.hpp"

namespace psdconv::test {

void FakeRasterizer::setBehaviorFor(std::string needle, Behavior behavior) {
  std::scoped_lock lock(_mutex);
  _overrides.emplace_back(std::move(needle), behavior);
}

FakeRasterizer::Behavior FakeRasterizer::behaviorFor(const std::filesystem::path& input,
                                                    std::string_view inputContent) const {
  const std::string filename = input.filename().string();
  for (const auto& [needle, behavior] : _overrides) {
    if (filename.contains(needle) || inputContent.contains(needle)) {
      return behavior;
    }
  }
  return _defaultBehavior;
}

std::string FakeRasterizer::OutputContentFor(std::string_view inputContent) {
  std::string ret("PNG:");
  ret.append(inputContent);
  return ret;
}

bool FakeRasterizer::rasterize(const std::filesystem::path& input, const std::filesystem::path& output,
                               std::chrono::milliseconds timeout) {
  std::string inputContent;
  {
    const File inputFile(input.string());
    if (inputFile) {
      inputContent = LoadAllContent(inputFile);
    }
  }

  Behavior behavior;
  {
    std::scoped_lock lock(_mutex);
    _calls.emplace_back(input, output, inputContent, timeout);
    behavior = behaviorFor(input, inputContent);
  }

  switch (behavior) {
    case Behavior::Succeed: {
      const File outputFile(output.string(), File::OpenMode::WriteTruncate);
      return outputFile && outputFile.writeAll(OutputContentFor(inputContent));
    }
    case Behavior::Timeout: {
      const File outputFile(output.string(), File::OpenMode::WriteTruncate);
      if (outputFile && !outputFile.writeAll("PNG:partial")) {
        log::error("Unable to write partial output {}", output.string());
      }
      log::error("Conversion of {} timed out after {} ms", input.string(), timeout.count());
      return false;
    }
    case Behavior::Fail:
      [[fallthrough]];
    default:
      log::error("Conversion of {} failed", input.string());
      return false;
  }
}

std::vector<FakeRasterizer::Call> FakeRasterizer::calls() const {
  std::scoped_lock lock(_mutex);
  return _calls;
}

std::size_t FakeRasterizer::nbCalls() const {
  std::scoped_lock lock(_mutex);
  return _calls.size();
}

}  // namespace psdconv::test
