#pragma once

#include <filesystem>
#include <string_view>
#include <utility>

namespace psdconv {

// Owns the on-disk lifetime of a transient file of the working directories.
// The file is removed when the object is destroyed, unless ownership was given away with release().
// Removal is best effort: failures are logged, never thrown. A file that does not exist is not an error.
class WorkingFile {
 public:
  WorkingFile() noexcept = default;

  explicit WorkingFile(std::filesystem::path path) noexcept : _path(std::move(path)) {}

  WorkingFile(const WorkingFile&) = delete;
  WorkingFile(WorkingFile&& other) noexcept;
  WorkingFile& operator=(const WorkingFile&) = delete;
  WorkingFile& operator=(WorkingFile&& other) noexcept;

  ~WorkingFile() { remove(); }

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return _path; }

  // Writes (or overwrites) the file with given content. Returns false on error (logged).
  [[nodiscard]] bool write(std::string_view content) const;

  // Removes the file now. Returns true if the file no longer exists.
  bool remove() noexcept;

  // Gives up ownership: the file will not be removed by this object.
  std::filesystem::path release() noexcept;

 private:
  std::filesystem::path _path;
};

}  // namespace psdconv
