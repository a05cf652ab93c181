#include "psdconv/zip-writer.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstddef>
#include <ctime>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/log.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

namespace {

constexpr int kEntryPermissions = 0644;

using ArchiveEntryPtr = std::unique_ptr<struct archive_entry, decltype(&::archive_entry_free)>;

// libarchive write callback, appending each chunk of the archive to the std::string given as client data.
la_ssize_t AppendChunk([[maybe_unused]] struct archive* archive, void* clientData, const void* buffer,
                       std::size_t length) {
  static_cast<std::string*>(clientData)->append(static_cast<const char*>(buffer), length);
  return static_cast<la_ssize_t>(length);
}

}  // namespace

ZipWriter::ZipWriter(SysTimePoint modificationTime)
    : _content(std::make_unique<std::string>()),
      _archive(::archive_write_new(), &::archive_write_free),
      _modificationTime(modificationTime) {
  if (!_archive) {
    throw std::runtime_error("Unable to allocate a libarchive writer");
  }
  check(::archive_write_set_format_zip(_archive.get()), "set ZIP format");
  check(::archive_write_zip_set_compression_deflate(_archive.get()), "set deflate compression");
  // The end of central directory record must be the last bytes of the archive: no block padding.
  check(::archive_write_set_bytes_in_last_block(_archive.get(), 1), "disable last block padding");
  check(::archive_write_open(_archive.get(), _content.get(), nullptr, &AppendChunk, nullptr),
        "open in memory archive");
}

ZipWriter::~ZipWriter() = default;

void ZipWriter::check(int status, std::string_view operation) const {
  if (status == ARCHIVE_OK) {
    return;
  }
  const char* errorStr = ::archive_error_string(_archive.get());
  if (status == ARCHIVE_WARN) {
    log::warn("libarchive warning on {}: {}", operation, errorStr == nullptr ? "unknown" : errorStr);
    return;
  }
  throw std::runtime_error(
      std::format("Unable to {} with libarchive: {}", operation, errorStr == nullptr ? "unknown error" : errorStr));
}

void ZipWriter::addEntry(std::string_view name, std::string_view content) {
  if (name.empty()) {
    throw std::invalid_argument("ZIP entry name cannot be empty");
  }
  if (!_content) {
    throw std::logic_error("Cannot add an entry to a finished ZIP archive");
  }

  ArchiveEntryPtr entry(::archive_entry_new(), &::archive_entry_free);
  if (!entry) {
    throw std::runtime_error("Unable to allocate a libarchive entry");
  }
  const std::string pathname(name);
  ::archive_entry_set_pathname(entry.get(), pathname.c_str());
  ::archive_entry_set_filetype(entry.get(), AE_IFREG);
  ::archive_entry_set_perm(entry.get(), kEntryPermissions);
  ::archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content.size()));
  ::archive_entry_set_mtime(entry.get(), SysClock::to_time_t(_modificationTime), 0);

  check(::archive_write_header(_archive.get(), entry.get()), "write entry header");
  if (!content.empty()) {
    const la_ssize_t written = ::archive_write_data(_archive.get(), content.data(), content.size());
    if (written < 0 || static_cast<std::size_t>(written) != content.size()) {
      check(ARCHIVE_FATAL, "write entry data");
    }
  }
  check(::archive_write_finish_entry(_archive.get()), "finish entry");
  ++_nbEntries;
}

std::string ZipWriter::finish() {
  if (!_content) {
    throw std::logic_error("ZIP archive already finished");
  }
  check(::archive_write_close(_archive.get()), "close archive");
  std::string ret = std::move(*_content);
  _content.reset();
  return ret;
}

}  // namespace psdconv
