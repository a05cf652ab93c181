#pragma once

#include <optional>
#include <string>

namespace psdconv::test {

// Sets (or unsets when value is nullopt) an environment variable for the lifetime of the object,
// restoring the previous state on destruction.
class ScopedEnvVar {
 public:
  ScopedEnvVar(const char* name, std::optional<std::string> value);

  ScopedEnvVar(const ScopedEnvVar&) = delete;
  ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;
  ScopedEnvVar(ScopedEnvVar&&) = delete;
  ScopedEnvVar& operator=(ScopedEnvVar&&) = delete;

  ~ScopedEnvVar();

 private:
  std::string _name;
  std::optional<std::string> _previous;
};

}  // namespace psdconv::test
