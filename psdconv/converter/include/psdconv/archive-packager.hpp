#pragma once

#include <optional>
#include <span>
#include <string>

#include "psdconv/converter-config.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

struct PackagedArchive {
  std::string content;
  // converted_<N>_files.zip, N being the number of converted names given to the packager.
  std::string downloadName;
};

// Bundles the converted outputs into an in-memory ZIP archive and removes them from the converted directory.
class ArchivePackager {
 public:
  // 'config' must outlive this object.
  explicit ArchivePackager(const ConverterConfig& config) noexcept : _config(config) {}

  // Returns std::nullopt if 'convertedNames' is empty. Outputs that vanished from disk, are not regular files or
  // cannot be opened are skipped with a warning.
  // Throws std::runtime_error if reading an opened output fails or if libarchive fails. The outputs are removed in
  // all cases.
  [[nodiscard]] std::optional<PackagedArchive> package(std::span<const std::string> convertedNames,
                                                       SysTimePoint now = SysClock::now()) const;

 private:
  const ConverterConfig& _config;
};

}  // namespace psdconv
