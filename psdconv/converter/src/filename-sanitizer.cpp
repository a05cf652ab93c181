#include "psdconv/filename-sanitizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

#include "psdconv/utf8-decoder.hpp"

namespace psdconv {

namespace {

constexpr char kReplacementChar = '_';

constexpr bool IsAsciiWordChar(char32_t codePoint) {
  return (codePoint >= U'a' && codePoint <= U'z') || (codePoint >= U'A' && codePoint <= U'Z') ||
         (codePoint >= U'0' && codePoint <= U'9') || codePoint == U'_';
}

}  // namespace

FilenameSanitizer::FilenameSanitizer(std::string_view allowedAlphabet) {
  while (!allowedAlphabet.empty()) {
    const auto utf8Char = DecodeFirstUtf8Char(allowedAlphabet);
    if (!utf8Char.valid()) {
      throw std::invalid_argument("Filename sanitizer alphabet is not valid UTF-8");
    }
    _allowedCodePoints.push_back(utf8Char.codePoint);
    allowedAlphabet.remove_prefix(utf8Char.nbBytes);
  }
  std::ranges::sort(_allowedCodePoints);
  const auto [first, last] = std::ranges::unique(_allowedCodePoints);
  _allowedCodePoints.erase(first, last);
}

bool FilenameSanitizer::isAllowed(char32_t codePoint) const noexcept {
  return std::ranges::binary_search(_allowedCodePoints, codePoint);
}

std::string FilenameSanitizer::sanitize(std::string_view filename) const {
  if (filename.empty()) {
    return std::string(1, kReplacementChar);
  }

  std::string ret;
  ret.reserve(filename.size());
  while (!filename.empty()) {
    const auto utf8Char = DecodeFirstUtf8Char(filename);
    const auto encoded = filename.substr(0, utf8Char.nbBytes);
    filename.remove_prefix(utf8Char.nbBytes);

    if (!utf8Char.valid()) {
      ret.push_back(kReplacementChar);
    } else if (utf8Char.codePoint == U'.') {
      ret.push_back(filename.starts_with('.') ? kReplacementChar : '.');
    } else if (IsAsciiWordChar(utf8Char.codePoint) || utf8Char.codePoint == U'-' || isAllowed(utf8Char.codePoint)) {
      ret.append(encoded);
    } else {
      ret.push_back(kReplacementChar);
    }
  }
  return ret;
}

std::string_view FileExtension(std::string_view filename) noexcept {
  const auto dotPos = filename.rfind('.');
  if (dotPos == std::string_view::npos) {
    return {};
  }
  return filename.substr(dotPos + 1);
}

std::string_view FileStem(std::string_view filename) noexcept {
  const auto dotPos = filename.rfind('.');
  if (dotPos == std::string_view::npos || dotPos == 0 || dotPos + 1 == filename.size()) {
    return filename;
  }
  return filename.substr(0, dotPos);
}

}  // namespace psdconv
