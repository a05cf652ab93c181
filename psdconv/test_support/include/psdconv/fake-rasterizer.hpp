#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "psdconv/rasterizer.hpp"

namespace psdconv::test {

// In-process Rasterizer standing in for the external program.
// A successful run writes OutputContentFor(<input content>) to the output path.
class FakeRasterizer : public Rasterizer {
 public:
  enum class Behavior : uint8_t {
    Succeed,
    // Returns false without producing anything.
    Fail,
    // Leaves a partial output behind and returns false, like a killed program would.
    Timeout
  };

  struct Call {
    std::filesystem::path input;
    std::filesystem::path output;
    // Content of 'input' at the time of the call.
    std::string inputContent;
    std::chrono::milliseconds timeout;
  };

  explicit FakeRasterizer(Behavior defaultBehavior = Behavior::Succeed) : _defaultBehavior(defaultBehavior) {}

  // Inputs whose file name or content contains 'needle' get 'behavior' instead of the default one.
  void setBehaviorFor(std::string needle, Behavior behavior);

  bool rasterize(const std::filesystem::path& input, const std::filesystem::path& output,
                 std::chrono::milliseconds timeout) override;

  [[nodiscard]] std::vector<Call> calls() const;

  [[nodiscard]] std::size_t nbCalls() const;

  static std::string OutputContentFor(std::string_view inputContent);

 private:
  Behavior behaviorFor(const std::filesystem::path& input, std::string_view inputContent) const;

  mutable std::mutex _mutex;
  Behavior _defaultBehavior;
  std::vector<std::pair<std::string, Behavior>> _overrides;
  std::vector<Call> _calls;
};

}  // namespace psdconv::test
