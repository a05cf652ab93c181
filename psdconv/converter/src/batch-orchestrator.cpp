#include "psdconv/batch-orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "psdconv/converter-config.hpp"
#include "psdconv/filename-sanitizer.hpp"
#include "psdconv/log.hpp"
#include "psdconv/rasterizer.hpp"
#include "psdconv/working-file.hpp"

namespace psdconv {

BatchOrchestrator::BatchOrchestrator(const ConverterConfig& config, Rasterizer& rasterizer)
    : _config(config), _rasterizer(rasterizer), _sanitizer(config.sanitizerAlphabet), _validator(config) {}

std::string BatchOrchestrator::outputName(std::string_view sanitizedName) const {
  std::string ret(FileStem(sanitizedName));
  ret.push_back('.');
  ret.append(_config.outputExtension);
  return ret;
}

BatchOutcome BatchOrchestrator::process(std::span<const UploadedFile> files) const {
  BatchOutcome outcome;
  for (const UploadedFile& file : files) {
    if (file.filename.empty() || !_validator.hasAllowedExtension(file.filename)) {
      continue;
    }
    std::string sanitizedName = _sanitizer.sanitize(file.filename);
    std::string pngName = outputName(sanitizedName);

    // Same named files of a batch share these paths: the last one wins.
    WorkingFile upload(_config.uploadDir / sanitizedName);
    std::filesystem::path outputPath = _config.convertedDir / pngName;

    bool converted = false;
    if (upload.write(file.content)) {
      // An output already there belongs to an earlier file of the batch, a failure must not remove it.
      std::error_code ec;
      const bool outputExisted = std::filesystem::exists(outputPath, ec);
      converted = _rasterizer.rasterize(upload.path(), outputPath, _config.conversionTimeout);
      if (!converted && !outputExisted) {
        WorkingFile(std::move(outputPath)).remove();
      }
    } else {
      log::error("Unable to save upload {} ({} bytes)", upload.path().string(), file.content.size());
    }

    if (converted) {
      // The packager takes over the output.
      outcome.converted.push_back(std::move(pngName));
    } else {
      outcome.failed.push_back(std::move(sanitizedName));
    }
    // 'upload' is removed here.
  }
  log::info("Batch of {} file(s): {} converted, {} failed", files.size(), outcome.converted.size(),
            outcome.failed.size());
  return outcome;
}

}  // namespace psdconv
