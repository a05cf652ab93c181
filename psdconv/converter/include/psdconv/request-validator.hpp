#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "psdconv/converter-config.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

struct SubmittedFile {
  std::string_view filename;
  std::size_t size{};
};

// Ordered list of human readable violations. Empty means valid.
using ValidationResult = vector<std::string>;

// Checks the count, per file and aggregated size limits of a batch before anything is written to disk.
class RequestValidator {
 public:
  explicit RequestValidator(const ConverterConfig& config);

  // Rules, in order:
  //  - more files than allowed: a single error, no other check is made.
  //  - for each file with a name, an error if its extension is not allowed, or if it is allowed but too large.
  //  - one error if the total size of the files with an allowed extension exceeds the aggregated limit.
  [[nodiscard]] ValidationResult validate(std::span<const SubmittedFile> files) const;

  // Whether the extension of 'filename' (case-insensitive) is accepted.
  [[nodiscard]] bool hasAllowedExtension(std::string_view filename) const noexcept;

 private:
  vector<std::string> _allowedExtensions;
  std::size_t _maxTotalRequestBytes;
  std::size_t _maxSingleFileBytes;
  uint32_t _maxFilesCount;
};

}  // namespace psdconv
