#pragma once

#include <string_view>

namespace psdconv {

// Optional whitespace of RFC 7230 header values.
inline constexpr std::string_view kOwsChars = " \t";

// Removes the leading and trailing characters of 'sv' that belong to 'chars'.
constexpr std::string_view Trim(std::string_view sv, std::string_view chars) noexcept {
  const auto first = sv.find_first_not_of(chars);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(chars) - first + 1);
}

constexpr std::string_view TrimOws(std::string_view sv) noexcept { return Trim(sv, kOwsChars); }

}  // namespace psdconv
