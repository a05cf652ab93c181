#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

#include "psdconv/timedef.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

// Deletes the regular files of the working directories whose status change time is older than the retention period.
class RetentionSweeper {
 public:
  RetentionSweeper(vector<std::filesystem::path> directories, std::chrono::seconds retentionPeriod);

  // Sweeps all directories (not recursively) and returns the number of deleted files.
  // Never throws: missing directories, permission errors and races with other requests are logged.
  std::size_t sweep(SysTimePoint now = SysClock::now()) const noexcept;

 private:
  std::size_t sweepDirectory(const std::filesystem::path& directory, SysTimePoint now) const;

  bool removeIfExpired(const std::filesystem::path& path, SysTimePoint now) const;

  vector<std::filesystem::path> _directories;
  std::chrono::seconds _retentionPeriod;
};

}  // namespace psdconv
