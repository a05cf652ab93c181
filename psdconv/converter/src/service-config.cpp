#include "psdconv/service-config.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include "psdconv/log.hpp"
#include "psdconv/stringconv.hpp"
#include "psdconv/units-parser.hpp"

namespace psdconv {

namespace {

// Returns an empty string_view if the variable is not set (or set to the empty string).
std::string_view EnvValue(const char* name) {
  const char* value = std::getenv(name);
  return value == nullptr ? std::string_view{} : std::string_view{value};
}

[[noreturn]] void ThrowInvalidEnv(const char* name, std::string_view value, const std::exception& ex) {
  throw std::invalid_argument(std::string("Invalid value '") + std::string(value) + "' for " + name + ": " +
                              ex.what());
}

template <class Integral>
Integral ParseEnvIntegral(const char* name, std::string_view value) {
  try {
    return StringToIntegral<Integral>(value);
  } catch (const std::invalid_argument& ex) {
    ThrowInvalidEnv(name, value, ex);
  }
}

std::size_t ParseEnvBytes(const char* name, std::string_view value) {
  int64_t nbBytes;
  try {
    nbBytes = ParseNumberOfBytes(value);
  } catch (const std::invalid_argument& ex) {
    ThrowInvalidEnv(name, value, ex);
  }
  if (nbBytes <= 0) {
    throw std::invalid_argument(std::string(name) + " should be strictly positive");
  }
  return static_cast<std::size_t>(nbBytes);
}

}  // namespace

void ServiceConfig::validate() const {
  converter.validate();
  http.validate();
  if (http.maxBodyBytes < converter.maxTotalRequestBytes) {
    throw std::invalid_argument("HTTP body limit should not be smaller than the total request size limit");
  }
}

ServiceConfig LoadServiceConfigFromEnv() {
  ServiceConfig config;
  config.http.withPort(kDefaultServicePort).withNbThreads(kDefaultNbWorkers);

  if (auto value = EnvValue("MAX_TOTAL_REQUEST_SIZE"); !value.empty()) {
    config.converter.withMaxTotalRequestBytes(ParseEnvBytes("MAX_TOTAL_REQUEST_SIZE", value));
  }
  if (auto value = EnvValue("MAX_SINGLE_FILE_SIZE"); !value.empty()) {
    config.converter.withMaxSingleFileBytes(ParseEnvBytes("MAX_SINGLE_FILE_SIZE", value));
  }
  if (auto value = EnvValue("MAX_FILES_COUNT"); !value.empty()) {
    config.converter.withMaxFilesCount(ParseEnvIntegral<uint32_t>("MAX_FILES_COUNT", value));
  }
  if (auto value = EnvValue("CONVERSION_TIMEOUT"); !value.empty()) {
    config.converter.withConversionTimeout(
        std::chrono::seconds{ParseEnvIntegral<uint32_t>("CONVERSION_TIMEOUT", value)});
  }
  if (auto value = EnvValue("UPLOAD_FOLDER"); !value.empty()) {
    config.converter.withUploadDir(value);
  }
  if (auto value = EnvValue("CONVERTED_FOLDER"); !value.empty()) {
    config.converter.withConvertedDir(value);
  }
  if (auto value = EnvValue("RASTERIZER"); !value.empty()) {
    config.converter.withRasterizerProgram(value);
  }
  if (auto value = EnvValue("PORT"); !value.empty()) {
    config.http.withPort(ParseEnvIntegral<uint16_t>("PORT", value));
  }
  if (auto value = EnvValue("WORKERS"); !value.empty()) {
    config.http.withNbThreads(ParseEnvIntegral<uint32_t>("WORKERS", value));
  }
  if (auto value = EnvValue("LOG_LEVEL"); !value.empty()) {
    try {
      config.logLevel = LogLevelFromString(value);
    } catch (const std::invalid_argument& ex) {
      ThrowInvalidEnv("LOG_LEVEL", value, ex);
    }
  }

  config.http.withMaxBodyBytes(config.converter.maxTotalRequestBytes);

  config.validate();
  return config;
}

}  // namespace psdconv
