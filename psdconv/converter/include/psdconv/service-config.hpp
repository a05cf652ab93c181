#pragma once

#include "psdconv/converter-config.hpp"
#include "psdconv/http-server-config.hpp"
#include "psdconv/log.hpp"

namespace psdconv {

inline constexpr uint16_t kDefaultServicePort = 5000;
inline constexpr uint32_t kDefaultNbWorkers = 2;

// Full configuration of the psdconv binary.
struct ServiceConfig {
  ConverterConfig converter;
  HttpServerConfig http;
  log::level::level_enum logLevel{log::level::info};

  // Validates both sub configurations. Throws std::invalid_argument if one of them is not valid.
  void validate() const;
};

// Builds the service configuration from the process environment.
// Recognized variables (all optional):
//   MAX_TOTAL_REQUEST_SIZE  bytes, unit suffixes accepted ("500Mi"), also caps the HTTP body
//   MAX_SINGLE_FILE_SIZE    bytes, unit suffixes accepted
//   MAX_FILES_COUNT         number of files per request
//   CONVERSION_TIMEOUT      seconds
//   UPLOAD_FOLDER           directory of the uploaded files
//   CONVERTED_FOLDER        directory of the converted files
//   RASTERIZER              program invoked for the conversion
//   PORT                    listening port (default 5000)
//   WORKERS                 number of event loop threads (default 2)
//   LOG_LEVEL               trace, debug, info, warn, error, critical or off (default info)
// Throws std::invalid_argument naming the variable if a value cannot be parsed or if the result is not valid.
ServiceConfig LoadServiceConfigFromEnv();

}  // namespace psdconv
