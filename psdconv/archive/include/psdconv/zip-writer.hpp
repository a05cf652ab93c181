#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "psdconv/timedef.hpp"

struct archive;

namespace psdconv {

// Builds a deflated ZIP archive in memory with libarchive.
//
// Usage:
//   ZipWriter zipWriter;
//   zipWriter.addEntry("a.png", contentA);
//   std::string archive = zipWriter.finish();
class ZipWriter {
 public:
  // All entries are timestamped with 'modificationTime'.
  // Throws std::runtime_error if libarchive cannot set up a ZIP writer.
  explicit ZipWriter(SysTimePoint modificationTime = SysClock::now());

  ZipWriter(const ZipWriter&) = delete;
  ZipWriter(ZipWriter&&) noexcept = default;
  ZipWriter& operator=(const ZipWriter&) = delete;
  ZipWriter& operator=(ZipWriter&&) = delete;

  ~ZipWriter();

  // Appends a regular file entry. Names are stored as given, without charset conversion.
  // Throws std::invalid_argument on an empty name, std::logic_error after finish() and std::runtime_error on
  // libarchive failure.
  void addEntry(std::string_view name, std::string_view content);

  [[nodiscard]] std::size_t nbEntries() const noexcept { return _nbEntries; }

  // Writes the central directory and returns the complete archive. No entry can be added afterwards.
  // Throws std::logic_error if called twice and std::runtime_error on libarchive failure.
  [[nodiscard]] std::string finish();

 private:
  using ArchivePtr = std::unique_ptr<struct archive, int (*)(struct archive*)>;

  void check(int status, std::string_view operation) const;

  // Declared before '_archive', which writes into it until freed.
  // Heap allocated so that its address, given to libarchive, survives moves of the writer.
  std::unique_ptr<std::string> _content;
  ArchivePtr _archive;
  std::size_t _nbEntries{};
  SysTimePoint _modificationTime;
};

}  // namespace psdconv
