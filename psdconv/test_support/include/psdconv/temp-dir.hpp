#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace psdconv::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (with its content) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "psdconv-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Creates (or overwrites) a file named 'name' directly under the directory and returns its full path.
  std::filesystem::path writeFile(std::string_view name, std::string_view content) const;

  // Creates a sub directory and returns its full path.
  std::filesystem::path makeSubDir(std::string_view name) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// Reads a whole file in memory. Throws std::runtime_error if it cannot be opened.
std::string ReadFile(const std::filesystem::path& path);

// Writes an executable /bin/sh script and returns its path.
std::filesystem::path WriteShellScript(const ScopedTempDir& dir, std::string_view name, std::string_view body);

}  // namespace psdconv::test
