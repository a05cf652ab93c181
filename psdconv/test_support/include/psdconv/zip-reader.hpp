#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace psdconv::test {

struct ZipEntry {
  std::string name;
  std::string content;
  // Seconds since epoch, as decoded by libarchive.
  int64_t mtime{0};
};

// Reads all entries of an in-memory ZIP archive with libarchive, in archive order.
// Throws std::runtime_error on any malformed archive.
std::vector<ZipEntry> ReadZip(std::string_view archive);

}  // namespace psdconv::test
