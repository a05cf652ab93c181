#include "psdconv/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/log.hpp"

namespace psdconv {

namespace {

int ComputeOpenFlags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    case File::OpenMode::WriteTruncate:
      return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

}  // namespace

File::File(const char* path, OpenMode mode) : _fd(::open(path, ComputeOpenFlags(mode), 0644)) {
  if (!_fd) {
    log::error("Unable to open file '{}': {}", path, std::strerror(errno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) == 0) {
    _fileSize = static_cast<std::size_t>(st.st_size);
  } else {
    log::error("fstat failed for '{}': {}", path, std::strerror(errno));
  }
}

std::size_t File::readAt(std::span<std::byte> dst, std::size_t offset) const {
  while (true) {
    const auto ret = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (ret >= 0) {
      return static_cast<std::size_t>(ret);
    }
    if (errno != EINTR) {
      log::error("pread failed for fd # {}: {}", _fd.fd(), std::strerror(errno));
      return kError;
    }
  }
}

bool File::writeAll(std::string_view data) const {
  while (!data.empty()) {
    const auto ret = ::write(_fd.fd(), data.data(), data.size());
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      log::error("write failed for fd # {}: {}", _fd.fd(), std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(ret));
  }
  return true;
}

std::string LoadAllContent(const File& file) {
  std::string content;
  if (file.size() != File::kError) {
    content.resize_and_overwrite(file.size(), [&file](char* data, std::size_t size) {
      std::size_t pos = 0;
      while (pos < size) {
        const auto nbRead =
            file.readAt(std::span<std::byte>(reinterpret_cast<std::byte*>(data) + pos, size - pos), pos);
        if (nbRead == File::kError) {
          throw std::runtime_error("Unable to read file content");
        }
        if (nbRead == 0) {
          break;
        }
        pos += nbRead;
      }
      return pos;
    });
  }
  return content;
}

}  // namespace psdconv
