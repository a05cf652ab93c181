#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace psdconv {

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize (glz::meta specialization or reflectable aggregate).
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace psdconv
