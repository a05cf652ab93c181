#include "psdconv/utf8-decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace psdconv {

Utf8Char DecodeFirstUtf8Char(std::string_view str) noexcept {
  Utf8Char ret;
  if (str.empty()) {
    ret.nbBytes = 0;
    return ret;
  }
  auto byte = static_cast<uint8_t>(str.front());
  if (byte <= 0x7F) {
    ret.codePoint = byte;
    return ret;
  }

  std::size_t remaining = 0;
  uint32_t codePoint = 0;
  uint32_t minCodePoint = 0;

  if ((byte & 0xE0) == 0xC0) {
    remaining = 1;
    codePoint = byte & 0x1FU;
    minCodePoint = 0x80;
  } else if ((byte & 0xF0) == 0xE0) {
    remaining = 2;
    codePoint = byte & 0x0FU;
    minCodePoint = 0x800;
  } else if ((byte & 0xF8) == 0xF0) {
    remaining = 3;
    codePoint = byte & 0x07U;
    minCodePoint = 0x10000;
  } else {
    // Invalid leading byte, or lone continuation byte
    return ret;
  }

  if (str.size() <= remaining) {
    return ret;
  }

  for (std::size_t idx = 1; idx <= remaining; ++idx) {
    byte = static_cast<uint8_t>(str[idx]);
    if ((byte & 0xC0) != 0x80) {
      return ret;
    }
    codePoint = (codePoint << 6) | (byte & 0x3FU);
  }

  if (codePoint < minCodePoint || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
    return ret;
  }

  ret.codePoint = codePoint;
  ret.nbBytes = remaining + 1;
  return ret;
}

bool IsValidUtf8(std::string_view str) noexcept {
  while (!str.empty()) {
    const auto utf8Char = DecodeFirstUtf8Char(str);
    if (!utf8Char.valid()) {
      return false;
    }
    str.remove_prefix(utf8Char.nbBytes);
  }
  return true;
}

}  // namespace psdconv
