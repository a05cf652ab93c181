#include <cstdlib>
#include <exception>
#include <filesystem>
#include <utility>

#include "psdconv/convert-service.hpp"
#include "psdconv/converter-config.hpp"
#include "psdconv/external-rasterizer.hpp"
#include "psdconv/log.hpp"
#include "psdconv/multi-http-server.hpp"
#include "psdconv/router.hpp"
#include "psdconv/service-config.hpp"
#include "psdconv/signal-handler.hpp"

using namespace psdconv;

namespace {

void LogConfiguration(const ServiceConfig& config) {
  const ConverterConfig& converter = config.converter;
  log::info("Starting PSD Converter with configuration:");
  log::info("  Max total request size: {}MB", converter.maxTotalRequestBytes / kBytesPerMiB);
  log::info("  Max single file size: {}MB", converter.maxSingleFileBytes / kBytesPerMiB);
  log::info("  Max files count: {}", converter.maxFilesCount);
  log::info("  Conversion timeout: {}s", converter.conversionTimeout.count());
  log::info("  Rasterizer: {}", converter.rasterizerProgram);
  log::info("  Upload folder: {}", converter.uploadDir.string());
  log::info("  Converted folder: {}", converter.convertedDir.string());
  log::info("  Port: {}, workers: {}", config.http.port, config.http.nbThreads);
}

}  // namespace

int main() {
  try {
    ServiceConfig config = LoadServiceConfigFromEnv();
    log::set_level(config.logLevel);
    LogConfiguration(config);

    std::filesystem::create_directories(config.converter.uploadDir);
    std::filesystem::create_directories(config.converter.convertedDir);

    SignalHandler::Enable();

    ExternalRasterizer rasterizer(config.converter.rasterizerProgram);
    const ConvertService service(std::move(config.converter), rasterizer);

    Router router;
    service.registerRoutes(router);

    MultiHttpServer server(std::move(config.http), router);
    log::info("Listening on port {}", server.port());
    server.run();
    log::info("Server stopped by signal {}", SignalHandler::StopSignal());
  } catch (const std::exception& ex) {
    log::critical("Fatal error: {}", ex.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
