#pragma once

#include <charconv>
#include <concepts>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "psdconv/log.hpp"

namespace psdconv {

// Decodes the whole of 'str' into an integral.
// Throws std::invalid_argument if 'str' is not entirely made of a valid representation of Integral.
template <std::integral Integral>
Integral StringToIntegral(std::string_view str) {
  Integral ret;

  const char* endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);

  if (errc != std::errc()) {
    log::error("Unable to decode '{}' into integral", str);
    throw std::invalid_argument("StringToIntegral conversion failed");
  }

  if (ptr != endPtr) {
    log::error("Only {} chars from '{}' decoded into integral {}", ptr - str.data(), str, ret);
    throw std::invalid_argument("StringToIntegral trailing characters");
  }
  return ret;
}

}  // namespace psdconv
