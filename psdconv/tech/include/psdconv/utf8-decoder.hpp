#pragma once

#include <cstddef>
#include <string_view>

namespace psdconv {

struct Utf8Char {
  static constexpr char32_t kInvalid = 0xFFFFFFFF;

  // Decoded code point, kInvalid if the sequence is malformed.
  char32_t codePoint{kInvalid};
  // Number of bytes consumed: the full sequence if valid, 1 otherwise.
  std::size_t nbBytes{1};

  [[nodiscard]] bool valid() const noexcept { return codePoint != kInvalid; }
};

// Decodes the first UTF-8 character of a non-empty string (RFC 3629 rules: no overlong forms, no surrogates,
// nothing above U+10FFFF). A malformed sequence consumes exactly one byte.
Utf8Char DecodeFirstUtf8Char(std::string_view str) noexcept;

// Returns true if 'str' is entirely made of valid UTF-8 sequences.
bool IsValidUtf8(std::string_view str) noexcept;

}  // namespace psdconv
