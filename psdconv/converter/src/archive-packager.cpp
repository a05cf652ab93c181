#include "psdconv/archive-packager.hpp"

#include <cstddef>
#include <filesystem>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <system_error>

#include "psdconv/file.hpp"
#include "psdconv/log.hpp"
#include "psdconv/timedef.hpp"
#include "psdconv/vector.hpp"
#include "psdconv/working-file.hpp"
#include "psdconv/zip-writer.hpp"

namespace psdconv {

std::optional<PackagedArchive> ArchivePackager::package(std::span<const std::string> convertedNames,
                                                        SysTimePoint now) const {
  if (convertedNames.empty()) {
    return std::nullopt;
  }

  // Outputs are owned from here: they are removed whatever happens below.
  vector<WorkingFile> outputs;
  outputs.reserve(convertedNames.size());
  for (const std::string& name : convertedNames) {
    outputs.emplace_back(_config.convertedDir / name);
  }

  ZipWriter zipWriter(now);
  for (std::size_t pos = 0; pos < convertedNames.size(); ++pos) {
    const auto& path = outputs[pos].path();
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (!std::filesystem::exists(status)) {
      log::warn("Converted file {} vanished before packaging", path.string());
      continue;
    }
    if (!std::filesystem::is_regular_file(status)) {
      log::warn("Converted output {} is not a regular file, not packaged", path.string());
      continue;
    }
    const File file(path.string());
    if (!file) {
      log::warn("Converted file {} cannot be opened, not packaged", path.string());
      continue;
    }
    zipWriter.addEntry(convertedNames[pos], LoadAllContent(file));
  }

  PackagedArchive archive;
  archive.downloadName = std::format("converted_{}_files.zip", convertedNames.size());
  log::info("Packaged {} file(s) into {}", zipWriter.nbEntries(), archive.downloadName);
  archive.content = zipWriter.finish();
  return archive;
}

}  // namespace psdconv
