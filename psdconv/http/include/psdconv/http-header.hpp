#pragma once

#include <string>
#include <string_view>

namespace psdconv::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

struct HeaderView {
  std::string_view name;
  std::string_view value;
};

// RFC 9110 token characters.
constexpr bool IsTChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (char ch : name) {
    if (!IsTChar(ch)) {
      return false;
    }
  }
  return true;
}

// Header values may contain visible chars, SP and HTAB. CR, LF and other controls are rejected.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if ((uch < 0x20 && ch != '\t') || uch == 0x7F) {
      return false;
    }
  }
  return true;
}

}  // namespace psdconv::http
