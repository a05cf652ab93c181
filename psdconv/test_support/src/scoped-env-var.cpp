#include "psdconv/scoped-env-var.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace psdconv::test {

ScopedEnvVar::ScopedEnvVar(const char* name, std::optional<std::string> value) : _name(name) {
  if (const char* previous = std::getenv(name); previous != nullptr) {
    _previous.emplace(previous);
  }
  if (value) {
    ::setenv(name, value->c_str(), 1);
  } else {
    ::unsetenv(name);
  }
}

ScopedEnvVar::~ScopedEnvVar() {
  if (_previous) {
    ::setenv(_name.c_str(), _previous->c_str(), 1);
  } else {
    ::unsetenv(_name.c_str());
  }
}

}  // namespace psdconv::test
