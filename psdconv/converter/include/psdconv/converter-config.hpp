#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace psdconv {

inline constexpr std::size_t kBytesPerMiB = 1024UL * 1024UL;

// Cyrillic letters a-ya, A-YA, yo and YO.
inline constexpr std::string_view kCyrillicAlphabet =
    "абвгдежзийклмнопрстуфхцчшщъыьэюяАБВГДЕЖЗИЙКЛМНОПРСТУФХЦЧШЩЪЫЬЭЮЯёЁ";

struct ConverterConfig {
  // ==============
  // Request limits
  // ==============
  // Maximum aggregated size of the files with an allowed extension in one request. Also used as the HTTP body cap.
  // Default: 500 MiB.
  std::size_t maxTotalRequestBytes{500UL * kBytesPerMiB};

  // Maximum size of a single file with an allowed extension. Default: 100 MiB.
  std::size_t maxSingleFileBytes{100UL * kBytesPerMiB};

  // Maximum number of files of a single request. Default: 100.
  uint32_t maxFilesCount{100};

  // ==========
  // Conversion
  // ==========
  // Wall-clock limit of a single rasterizer run. Default: 30 s.
  std::chrono::seconds conversionTimeout{30};

  // Program invoked as '<program> <input>[0] <output>'. Looked up in PATH. Default: ImageMagick 'convert'.
  std::string rasterizerProgram{"convert"};

  // Accepted input extensions, lower case without the dot. Default: {"psd"}.
  std::vector<std::string> allowedExtensions{"psd"};

  // Extension of the produced images, without the dot. Default: "png".
  std::string outputExtension{"png"};

  // UTF-8 encoded characters kept by the filename sanitizer on top of [A-Za-z0-9_.-].
  std::string sanitizerAlphabet{kCyrillicAlphabet};

  // ==================
  // Working directories
  // ==================
  std::filesystem::path uploadDir{"uploads"};
  std::filesystem::path convertedDir{"converted"};

  // Working files older than this are deleted by the retention sweep. Default: 3600 s.
  std::chrono::seconds retentionPeriod{3600};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  ConverterConfig& withMaxTotalRequestBytes(std::size_t maxTotalRequestBytes);

  ConverterConfig& withMaxSingleFileBytes(std::size_t maxSingleFileBytes);

  ConverterConfig& withMaxFilesCount(uint32_t maxFilesCount);

  ConverterConfig& withConversionTimeout(std::chrono::seconds timeout);

  ConverterConfig& withRasterizerProgram(std::string_view program);

  ConverterConfig& withAllowedExtensions(std::vector<std::string> extensions);

  ConverterConfig& withOutputExtension(std::string_view extension);

  ConverterConfig& withSanitizerAlphabet(std::string_view alphabet);

  ConverterConfig& withUploadDir(std::filesystem::path dir);

  ConverterConfig& withConvertedDir(std::filesystem::path dir);

  ConverterConfig& withRetentionPeriod(std::chrono::seconds retentionPeriod);
};

}  // namespace psdconv
