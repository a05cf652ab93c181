#include "psdconv/convert-service.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/archive-packager.hpp"
#include "psdconv/batch-orchestrator.hpp"
#include "psdconv/converter-config.hpp"
#include "psdconv/http-constants.hpp"
#include "psdconv/http-error-build.hpp"
#include "psdconv/http-method.hpp"
#include "psdconv/http-request.hpp"
#include "psdconv/http-response.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/json-serializer.hpp"
#include "psdconv/landing-page.hpp"
#include "psdconv/log.hpp"
#include "psdconv/multipart-form-data.hpp"
#include "psdconv/rasterizer.hpp"
#include "psdconv/request-validator.hpp"
#include "psdconv/router.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

struct ValidationFailedBody {
  std::string_view error;
  std::span<const std::string> details;
};

struct ConversionFailedBody {
  std::string_view error;
  std::span<const std::string> failed_files;
};

struct ConfigBody {
  std::size_t maxTotalRequestSizeMb;
  std::size_t maxSingleFileSizeMb;
  uint32_t maxFilesCount;
  int64_t conversionTimeoutSeconds;
};

struct HealthBody {
  std::string_view status;
};

}  // namespace psdconv

template <>
struct glz::meta<psdconv::ValidationFailedBody> {
  using T = psdconv::ValidationFailedBody;
  static constexpr auto value = glz::object("error", &T::error, "details", &T::details);
};

template <>
struct glz::meta<psdconv::ConversionFailedBody> {
  using T = psdconv::ConversionFailedBody;
  static constexpr auto value = glz::object("error", &T::error, "failed_files", &T::failed_files);
};

template <>
struct glz::meta<psdconv::ConfigBody> {
  using T = psdconv::ConfigBody;
  static constexpr auto value =
      glz::object("max_total_request_size_mb", &T::maxTotalRequestSizeMb, "max_single_file_size_mb",
                  &T::maxSingleFileSizeMb, "max_files_count", &T::maxFilesCount, "conversion_timeout_seconds",
                  &T::conversionTimeoutSeconds);
};

template <>
struct glz::meta<psdconv::HealthBody> {
  using T = psdconv::HealthBody;
  static constexpr auto value = glz::object("status", &T::status);
};

namespace psdconv {

namespace {

constexpr std::string_view kFilesField = "files";
constexpr std::size_t kMinMultipartParts = 1000;

ConverterConfig Validated(ConverterConfig config) {
  config.validate();
  return config;
}

}  // namespace

ConvertService::ConvertService(ConverterConfig config, Rasterizer& rasterizer)
    : _config(Validated(std::move(config))),
      _sweeper({_config.uploadDir, _config.convertedDir}, _config.retentionPeriod),
      _validator(_config),
      _orchestrator(_config, rasterizer),
      _packager(_config),
      _landingPage(RenderLandingPage(_config)) {}

void ConvertService::registerRoutes(Router& router) const {
  router.setPath(http::Method::GET, "/", [this](const HttpRequest&) { return handleIndex(); });
  router.setPath(http::Method::POST, "/convert", [this](const HttpRequest& req) { return handleConvert(req); });
  router.setPath(http::Method::POST, "/api/convert", [this](const HttpRequest& req) { return handleConvert(req); });
  router.setPath(http::Method::GET, "/config", [this](const HttpRequest&) { return handleConfig(); });
  router.setPath(http::Method::GET, "/health", [](const HttpRequest&) { return handleHealth(); });
}

HttpResponse ConvertService::handleIndex() const {
  return {http::StatusCodeOK, _landingPage, http::ContentTypeTextHtml};
}

HttpResponse ConvertService::handleConfig() const {
  const ConfigBody body{_config.maxTotalRequestBytes / kBytesPerMiB, _config.maxSingleFileBytes / kBytesPerMiB,
                        _config.maxFilesCount, static_cast<int64_t>(_config.conversionTimeout.count())};
  return {http::StatusCodeOK, SerializeToJson(body), http::ContentTypeApplicationJson};
}

HttpResponse ConvertService::handleHealth() {
  return {http::StatusCodeOK, SerializeToJson(HealthBody{"healthy"}), http::ContentTypeApplicationJson};
}

HttpResponse ConvertService::handleConvert(const HttpRequest& request) const {
  _sweeper.sweep();

  const std::string_view contentType = request.headerValueOrEmpty(http::ContentType);
  if (ExtractMultipartBoundary(contentType).empty()) {
    return MakeJsonErrorResponse(http::StatusCodeBadRequest, "No files provided");
  }

  const MultipartFormData form(
      contentType, request.body(),
      MultipartFormDataOptions{.maxParts = std::max<std::size_t>(kMinMultipartParts, 2UL * _config.maxFilesCount)});
  if (!form.valid()) {
    log::warn("Rejecting malformed upload: {}", form.invalidReason());
    return MakeJsonErrorResponse(http::StatusCodeBadRequest,
                                 std::format("Invalid multipart/form-data body: {}", form.invalidReason()));
  }

  // Only parts carrying a filename parameter are uploaded files, the others are plain form fields.
  vector<UploadedFile> files;
  for (const MultipartFormData::Part& part : form.parts()) {
    if (part.name == kFilesField && part.filename) {
      files.emplace_back(*part.filename, part.value);
    }
  }
  if (files.empty()) {
    return MakeJsonErrorResponse(http::StatusCodeBadRequest, "No files provided");
  }
  if (files.front().filename.empty()) {
    return MakeJsonErrorResponse(http::StatusCodeBadRequest, "No selected files");
  }

  vector<SubmittedFile> submitted;
  submitted.reserve(files.size());
  for (const UploadedFile& file : files) {
    submitted.emplace_back(file.filename, file.content.size());
  }
  const ValidationResult errors = _validator.validate(submitted);
  if (!errors.empty()) {
    log::info("Rejecting batch of {} file(s): {} validation error(s)", files.size(), errors.size());
    return {http::StatusCodeBadRequest,
            SerializeToJson(ValidationFailedBody{"Validation failed", std::span<const std::string>(errors)}),
            http::ContentTypeApplicationJson};
  }

  BatchOutcome outcome = _orchestrator.process(files);

  auto archive = _packager.package(outcome.converted);
  if (!archive) {
    return {http::StatusCodeInternalServerError,
            SerializeToJson(ConversionFailedBody{"No files were successfully converted",
                                                 std::span<const std::string>(outcome.failed)}),
            http::ContentTypeApplicationJson};
  }

  HttpResponse response(http::StatusCodeOK, std::move(archive->content), http::ContentTypeApplicationZip);
  response.header(http::ContentDisposition, std::format("attachment; filename={}", archive->downloadName));
  return response;
}

}  // namespace psdconv
