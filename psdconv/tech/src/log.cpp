#include "psdconv/log.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace psdconv {

log::level::level_enum LogLevelFromString(std::string_view levelName) {
  const std::string name(levelName);
  const auto level = log::level::from_str(name);
  // from_str maps unknown names to 'off', so distinguish an explicit "off" from a typo
  if (level == log::level::off && name != "off") {
    throw std::invalid_argument("Unknown log level '" + name + "'");
  }
  return level;
}

}  // namespace psdconv
