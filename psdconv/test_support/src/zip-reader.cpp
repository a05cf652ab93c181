#include "psdconv/zip-reader.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace psdconv::test {

namespace {

using ArchiveReadPtr = std::unique_ptr<struct archive, decltype(&::archive_read_free)>;

[[noreturn]] void ThrowArchiveError(struct archive* archive, std::string_view operation) {
  const char* errorStr = ::archive_error_string(archive);
  throw std::runtime_error(std::format("ZIP {} failed: {}", operation, errorStr == nullptr ? "unknown" : errorStr));
}

}  // namespace

std::vector<ZipEntry> ReadZip(std::string_view archive) {
  ArchiveReadPtr reader(::archive_read_new(), &::archive_read_free);
  if (!reader) {
    throw std::runtime_error("Unable to allocate a libarchive reader");
  }
  if (::archive_read_support_format_zip(reader.get()) != ARCHIVE_OK) {
    ThrowArchiveError(reader.get(), "format setup");
  }
  if (::archive_read_open_memory(reader.get(), archive.data(), archive.size()) != ARCHIVE_OK) {
    ThrowArchiveError(reader.get(), "open");
  }

  std::vector<ZipEntry> entries;
  struct archive_entry* header = nullptr;
  for (;;) {
    const int status = ::archive_read_next_header(reader.get(), &header);
    if (status == ARCHIVE_EOF) {
      break;
    }
    if (status < ARCHIVE_WARN) {
      ThrowArchiveError(reader.get(), "header read");
    }
    ZipEntry& entry = entries.emplace_back();
    const char* pathname = ::archive_entry_pathname(header);
    entry.name = pathname == nullptr ? "" : pathname;
    entry.mtime = static_cast<int64_t>(::archive_entry_mtime(header));

    std::array<char, 16384> buffer;
    for (;;) {
      const la_ssize_t nbRead = ::archive_read_data(reader.get(), buffer.data(), buffer.size());
      if (nbRead == 0) {
        break;
      }
      if (nbRead < 0) {
        ThrowArchiveError(reader.get(), std::format("data read of {}", entry.name));
      }
      entry.content.append(buffer.data(), static_cast<std::size_t>(nbRead));
    }
  }
  return entries;
}

}  // namespace psdconv::test
