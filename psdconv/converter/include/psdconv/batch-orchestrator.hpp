#pragma once

#include <span>
#include <string>
#include <string_view>

#include "psdconv/converter-config.hpp"
#include "psdconv/filename-sanitizer.hpp"
#include "psdconv/rasterizer.hpp"
#include "psdconv/request-validator.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

struct UploadedFile {
  std::string_view filename;
  std::string_view content;
};

struct BatchOutcome {
  // Output names (in the converted directory), in submission order.
  vector<std::string> converted;
  // Sanitized input names whose conversion failed, in submission order.
  vector<std::string> failed;
};

// Converts the files of one request sequentially: save, rasterize, delete the saved upload.
// Converted outputs are left in the converted directory, the caller takes ownership of them.
class BatchOrchestrator {
 public:
  // 'config' and 'rasterizer' must outlive this object.
  BatchOrchestrator(const ConverterConfig& config, Rasterizer& rasterizer);

  // Files without a name or with an extension that is not allowed are skipped.
  [[nodiscard]] BatchOutcome process(std::span<const UploadedFile> files) const;

  // Name of the output produced from a sanitized input name.
  [[nodiscard]] std::string outputName(std::string_view sanitizedName) const;

 private:
  const ConverterConfig& _config;
  Rasterizer& _rasterizer;
  FilenameSanitizer _sanitizer;
  RequestValidator _validator;
};

}  // namespace psdconv
