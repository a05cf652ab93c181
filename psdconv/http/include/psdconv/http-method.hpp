#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <optional>
#include <string_view>

namespace psdconv::http {

// Request methods understood by the parser, one bit each so that a set of methods fits in a MethodBmp.
// A request line with any other token is answered with 501.
enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodBmp = uint16_t;
using MethodIdx = uint8_t;

struct MethodTraits {
  std::string_view name;
  // Requests without Content-Length are answered with 411.
  bool expectsBody;
};

// Indexed by MethodToIdx.
inline constexpr std::array kMethodTraits{
    MethodTraits{"GET", false},     MethodTraits{"HEAD", false},    MethodTraits{"POST", true},
    MethodTraits{"PUT", true},      MethodTraits{"DELETE", false},  MethodTraits{"CONNECT", false},
    MethodTraits{"OPTIONS", false}, MethodTraits{"TRACE", false},   MethodTraits{"PATCH", true}};

inline constexpr MethodIdx kNbMethods = static_cast<MethodIdx>(kMethodTraits.size());

static_assert(kNbMethods <= 8 * sizeof(MethodBmp));

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | static_cast<MethodBmp>(rhs));
}

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept { return static_cast<MethodBmp>(lhs) | rhs; }

constexpr bool IsMethodSet(MethodBmp methods, Method method) noexcept {
  return (methods & static_cast<MethodBmp>(method)) != 0;
}

constexpr MethodIdx MethodToIdx(Method method) noexcept {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodBmp>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) noexcept { return static_cast<Method>(1U << methodIdx); }

constexpr std::string_view MethodToStr(Method method) noexcept { return kMethodTraits[MethodToIdx(method)].name; }

constexpr bool MethodExpectsBody(Method method) noexcept { return kMethodTraits[MethodToIdx(method)].expectsBody; }

// Method tokens are case-sensitive (RFC 9110).
constexpr std::optional<Method> MethodStrToOpt(std::string_view str) noexcept {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodTraits[methodIdx].name == str) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

}  // namespace psdconv::http
