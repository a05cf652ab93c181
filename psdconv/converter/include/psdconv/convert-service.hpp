#pragma once

#include <string>

#include "psdconv/archive-packager.hpp"
#include "psdconv/batch-orchestrator.hpp"
#include "psdconv/converter-config.hpp"
#include "psdconv/http-request.hpp"
#include "psdconv/http-response.hpp"
#include "psdconv/rasterizer.hpp"
#include "psdconv/request-validator.hpp"
#include "psdconv/retention-sweeper.hpp"
#include "psdconv/router.hpp"

namespace psdconv {

// HTTP endpoints of the converter:
//   GET  /             landing page with the active limits
//   POST /convert      multipart upload (field "files") converted into a ZIP of PNG images
//   POST /api/convert  alias of /convert
//   GET  /config       active limits as JSON
//   GET  /health       liveness probe
//
// Handlers only read immutable state and may be called concurrently from several event loop threads.
class ConvertService {
 public:
  // Throws std::invalid_argument if config is invalid. 'rasterizer' must outlive this object.
  ConvertService(ConverterConfig config, Rasterizer& rasterizer);

  // Handlers reference this object, which must outlive the servers using 'router'.
  ConvertService(const ConvertService&) = delete;
  ConvertService(ConvertService&&) = delete;
  ConvertService& operator=(const ConvertService&) = delete;
  ConvertService& operator=(ConvertService&&) = delete;

  ~ConvertService() = default;

  void registerRoutes(Router& router) const;

  [[nodiscard]] HttpResponse handleConvert(const HttpRequest& request) const;

  [[nodiscard]] HttpResponse handleIndex() const;

  [[nodiscard]] HttpResponse handleConfig() const;

  [[nodiscard]] static HttpResponse handleHealth();

  [[nodiscard]] const ConverterConfig& config() const noexcept { return _config; }

 private:
  ConverterConfig _config;
  RetentionSweeper _sweeper;
  RequestValidator _validator;
  BatchOrchestrator _orchestrator;
  ArchivePackager _packager;
  std::string _landingPage;
};

}  // namespace psdconv
