#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "psdconv/base-fd.hpp"

namespace psdconv {

class File {
 public:
  // WriteTruncate creates the file if needed (mode 0644) and truncates it.
  enum class OpenMode : uint8_t { ReadOnly, WriteTruncate };

  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. Does not throw on open failure (logged): operator bool() returns false.
  explicit File(const std::string& path, OpenMode mode = OpenMode::ReadOnly) : File(path.c_str(), mode) {}

  // Open a file by path (must be null-terminated).
  explicit File(const char* path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the file size in bytes, at the time of opening (kError if unknown).
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Returns the number of bytes read (0 on EOF). Returns kError on error.
  [[nodiscard]] std::size_t readAt(std::span<std::byte> dst, std::size_t offset) const;

  // Write all of 'data' at the current offset, retrying on short writes and EINTR.
  // Returns false on error (logged).
  [[nodiscard]] bool writeAll(std::string_view data) const;

 private:
  BaseFd _fd;
  std::size_t _fileSize{kError};
};

// Read the whole content of an opened File.
// Throws std::runtime_error on read failure.
std::string LoadAllContent(const File& file);

}  // namespace psdconv
