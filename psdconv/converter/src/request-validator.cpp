#include "psdconv/request-validator.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <span>
#include <string>
#include <string_view>

#include "psdconv/converter-config.hpp"
#include "psdconv/filename-sanitizer.hpp"
#include "psdconv/string-equal-ignore-case.hpp"

namespace psdconv {

RequestValidator::RequestValidator(const ConverterConfig& config)
    : _allowedExtensions(config.allowedExtensions.begin(), config.allowedExtensions.end()),
      _maxTotalRequestBytes(config.maxTotalRequestBytes),
      _maxSingleFileBytes(config.maxSingleFileBytes),
      _maxFilesCount(config.maxFilesCount) {}

bool RequestValidator::hasAllowedExtension(std::string_view filename) const noexcept {
  const auto extension = FileExtension(filename);
  return std::ranges::any_of(_allowedExtensions,
                             [extension](std::string_view allowed) { return CaseInsensitiveEqual(extension, allowed); });
}

ValidationResult RequestValidator::validate(std::span<const SubmittedFile> files) const {
  ValidationResult errors;
  if (files.size() > _maxFilesCount) {
    errors.push_back(std::format("Too many files. Maximum: {}", _maxFilesCount));
    return errors;
  }

  std::size_t totalSize = 0;
  for (const SubmittedFile& file : files) {
    if (file.filename.empty()) {
      // Parts without a filename only count for the number of files.
      continue;
    }
    if (!hasAllowedExtension(file.filename)) {
      errors.push_back(std::format("File {} is not in PSD format", file.filename));
      continue;
    }
    if (file.size > _maxSingleFileBytes) {
      errors.push_back(std::format("File {} is too large ({}MB). Maximum: {}MB", file.filename,
                                   file.size / kBytesPerMiB, _maxSingleFileBytes / kBytesPerMiB));
    }
    totalSize += file.size;
  }

  if (totalSize > _maxTotalRequestBytes) {
    errors.push_back(std::format("Total size of files ({}MB) exceeds the limit ({}MB)", totalSize / kBytesPerMiB,
                                 _maxTotalRequestBytes / kBytesPerMiB));
  }
  return errors;
}

}  // namespace psdconv
