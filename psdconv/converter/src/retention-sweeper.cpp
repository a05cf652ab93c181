#include "psdconv/retention-sweeper.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include "psdconv/log.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

namespace {

SysTimePoint StatusChangeTime(const struct stat& st) {
  return SysTimePoint{std::chrono::duration_cast<SysDuration>(std::chrono::seconds{st.st_ctim.tv_sec} +
                                                              std::chrono::nanoseconds{st.st_ctim.tv_nsec})};
}

}  // namespace

RetentionSweeper::RetentionSweeper(vector<std::filesystem::path> directories, std::chrono::seconds retentionPeriod)
    : _directories(std::move(directories)), _retentionPeriod(retentionPeriod) {}

std::size_t RetentionSweeper::sweep(SysTimePoint now) const noexcept {
  std::size_t nbRemoved = 0;
  for (const auto& directory : _directories) {
    try {
      nbRemoved += sweepDirectory(directory, now);
    } catch (const std::exception& ex) {
      log::error("Cleanup error in {}: {}", directory.string(), ex.what());
    }
  }
  return nbRemoved;
}

std::size_t RetentionSweeper::sweepDirectory(const std::filesystem::path& directory, SysTimePoint now) const {
  std::error_code ec;
  std::filesystem::directory_iterator dirIt(directory, ec);
  if (ec) {
    log::error("Cleanup error: cannot list {}: {}", directory.string(), ec.message());
    return 0;
  }

  std::size_t nbRemoved = 0;
  for (const std::filesystem::directory_iterator end; dirIt != end;) {
    if (removeIfExpired(dirIt->path(), now)) {
      ++nbRemoved;
    }
    dirIt.increment(ec);
    if (ec) {
      log::error("Cleanup error while listing {}: {}", directory.string(), ec.message());
      break;
    }
  }
  return nbRemoved;
}

bool RetentionSweeper::removeIfExpired(const std::filesystem::path& path, SysTimePoint now) const {
  struct stat st{};
  // lstat: a symbolic link is not a regular file of the working directory.
  if (::lstat(path.c_str(), &st) != 0) {
    // ENOENT: removed concurrently by another request.
    if (errno != ENOENT) {
      log::error("Cleanup error: cannot stat {}: {}", path.string(), std::strerror(errno));
    }
    return false;
  }
  if (!S_ISREG(st.st_mode) || now - StatusChangeTime(st) <= _retentionPeriod) {
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::remove(path, ec)) {
    if (ec) {
      log::error("Cleanup error: cannot remove {}: {}", path.string(), ec.message());
    }
    return false;
  }
  log::info("Cleaned up old file: {}", path.filename().string());
  return true;
}

}  // namespace psdconv
