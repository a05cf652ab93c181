#include "psdconv/working-file.hpp"

#include <filesystem>
#include <string_view>
#include <system_error>
#include <utility>

#include "psdconv/file.hpp"
#include "psdconv/log.hpp"

namespace psdconv {

WorkingFile::WorkingFile(WorkingFile&& other) noexcept : _path(std::exchange(other._path, {})) {}

WorkingFile& WorkingFile::operator=(WorkingFile&& other) noexcept {
  if (this != &other) {
    remove();
    _path = std::exchange(other._path, {});
  }
  return *this;
}

bool WorkingFile::write(std::string_view content) const {
  const File file(_path.string(), File::OpenMode::WriteTruncate);
  if (!file) {
    return false;
  }
  return file.writeAll(content);
}

bool WorkingFile::remove() noexcept {
  if (_path.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::remove(_path, ec);
  if (ec) {
    log::error("Error removing working file {}: {}", _path.string(), ec.message());
    return false;
  }
  _path.clear();
  return true;
}

std::filesystem::path WorkingFile::release() noexcept { return std::exchange(_path, {}); }

}  // namespace psdconv
