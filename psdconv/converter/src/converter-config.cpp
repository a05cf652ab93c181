#include "psdconv/converter-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "psdconv/utf8-decoder.hpp"

namespace psdconv {

namespace {

void CheckExtension(std::string_view extension, std::string_view what) {
  if (extension.empty()) {
    throw std::invalid_argument(std::format("{} cannot be empty", what));
  }
  if (extension.find_first_of("./\\") != std::string_view::npos) {
    throw std::invalid_argument(std::format("{} '{}' should not contain '.', '/' or '\\'", what, extension));
  }
}

}  // namespace

ConverterConfig& ConverterConfig::withMaxTotalRequestBytes(std::size_t maxTotalRequestBytes) {
  this->maxTotalRequestBytes = maxTotalRequestBytes;
  return *this;
}

ConverterConfig& ConverterConfig::withMaxSingleFileBytes(std::size_t maxSingleFileBytes) {
  this->maxSingleFileBytes = maxSingleFileBytes;
  return *this;
}

ConverterConfig& ConverterConfig::withMaxFilesCount(uint32_t maxFilesCount) {
  this->maxFilesCount = maxFilesCount;
  return *this;
}

ConverterConfig& ConverterConfig::withConversionTimeout(std::chrono::seconds timeout) {
  this->conversionTimeout = timeout;
  return *this;
}

ConverterConfig& ConverterConfig::withRasterizerProgram(std::string_view program) {
  this->rasterizerProgram.assign(program);
  return *this;
}

ConverterConfig& ConverterConfig::withAllowedExtensions(std::vector<std::string> extensions) {
  this->allowedExtensions = std::move(extensions);
  return *this;
}

ConverterConfig& ConverterConfig::withOutputExtension(std::string_view extension) {
  this->outputExtension.assign(extension);
  return *this;
}

ConverterConfig& ConverterConfig::withSanitizerAlphabet(std::string_view alphabet) {
  this->sanitizerAlphabet.assign(alphabet);
  return *this;
}

ConverterConfig& ConverterConfig::withUploadDir(std::filesystem::path dir) {
  this->uploadDir = std::move(dir);
  return *this;
}

ConverterConfig& ConverterConfig::withConvertedDir(std::filesystem::path dir) {
  this->convertedDir = std::move(dir);
  return *this;
}

ConverterConfig& ConverterConfig::withRetentionPeriod(std::chrono::seconds retentionPeriod) {
  this->retentionPeriod = retentionPeriod;
  return *this;
}

void ConverterConfig::validate() const {
  if (maxTotalRequestBytes == 0) {
    throw std::invalid_argument("maxTotalRequestBytes must be > 0");
  }
  if (maxSingleFileBytes == 0) {
    throw std::invalid_argument("maxSingleFileBytes must be > 0");
  }
  if (maxFilesCount == 0) {
    throw std::invalid_argument("maxFilesCount must be > 0");
  }
  if (conversionTimeout.count() <= 0) {
    throw std::invalid_argument("conversionTimeout must be > 0");
  }
  if (rasterizerProgram.empty()) {
    throw std::invalid_argument("rasterizerProgram cannot be empty");
  }
  if (allowedExtensions.empty()) {
    throw std::invalid_argument("at least one allowed extension is required");
  }
  for (const std::string& extension : allowedExtensions) {
    CheckExtension(extension, "allowed extension");
    if (std::ranges::any_of(extension, [](char ch) { return ch >= 'A' && ch <= 'Z'; })) {
      throw std::invalid_argument(std::format("allowed extension '{}' should be lower case", extension));
    }
  }
  CheckExtension(outputExtension, "output extension");
  if (!IsValidUtf8(sanitizerAlphabet)) {
    throw std::invalid_argument("sanitizerAlphabet is not valid UTF-8");
  }
  if (uploadDir.empty() || convertedDir.empty()) {
    throw std::invalid_argument("working directories cannot be empty");
  }
  if (retentionPeriod.count() <= 0) {
    throw std::invalid_argument("retentionPeriod must be > 0");
  }
}

}  // namespace psdconv
