#pragma once

#include <chrono>
#include <filesystem>

namespace psdconv {

// Flattens the first layer of a layered image into a raster image file.
// Implementations must be callable concurrently from several event loop threads.
class Rasterizer {
 public:
  virtual ~Rasterizer() = default;

  // Returns true if 'output' was produced within 'timeout'. Never throws: failures are logged.
  virtual bool rasterize(const std::filesystem::path& input, const std::filesystem::path& output,
                         std::chrono::milliseconds timeout) = 0;
};

}  // namespace psdconv
