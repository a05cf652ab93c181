#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "psdconv/rasterizer.hpp"

namespace psdconv {

// Runs '<program> <input>[0] <output>' (ImageMagick syntax selecting the first frame) as a child process.
// The whole process group is killed when the timeout expires.
class ExternalRasterizer : public Rasterizer {
 public:
  explicit ExternalRasterizer(std::string program);

  bool rasterize(const std::filesystem::path& input, const std::filesystem::path& output,
                 std::chrono::milliseconds timeout) override;

  [[nodiscard]] const std::string& program() const noexcept { return _program; }

 private:
  std::string _program;
};

}  // namespace psdconv
