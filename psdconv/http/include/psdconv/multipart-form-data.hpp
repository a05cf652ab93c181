#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string_view>

#include "psdconv/http-header.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

struct MultipartFormDataOptions {
  // 0 means unlimited for all limits.
  std::size_t maxParts{1000};
  std::size_t maxHeadersPerPart{32};
  std::size_t maxPartSizeBytes{0};
};

// Zero-copy multipart/form-data (RFC 7578) parser.
// Parts and their headers are views over the body given to the constructor, which must outlive this object.
class MultipartFormData {
 public:
  MultipartFormData() noexcept = default;

  // Parse multipart/form-data from the given Content-Type header and body without throwing on malformed input.
  MultipartFormData(std::string_view contentTypeHeader, std::string_view body, MultipartFormDataOptions options = {});

  struct Part {
    std::string_view name;
    // Present only if the Content-Disposition carries a filename (possibly empty) parameter.
    std::optional<std::string_view> filename;
    std::optional<std::string_view> contentType;
    std::string_view value;

    // Get all headers associated with this part
    [[nodiscard]] std::span<const http::HeaderView> headers() const noexcept { return _headers; }

    // Get the value of the specified header, or an empty string_view if not present
    [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept;

   private:
    friend class MultipartFormData;

    std::size_t _headerOffset{0};
    std::size_t _headerCount{0};
    std::span<const http::HeaderView> _headers;
  };

  // Get all parsed parts
  [[nodiscard]] std::span<const Part> parts() const noexcept { return _parts; }

  // Check if any parts were parsed
  [[nodiscard]] bool empty() const noexcept { return _parts.empty(); }

  // Get the first part with the given name, or nullptr if not found
  [[nodiscard]] const Part* part(std::string_view name) const noexcept;

  // Get all parts with the given name, in body order
  [[nodiscard]] vector<std::reference_wrapper<const Part>> parts(std::string_view name) const;

  // Check if the MultipartFormData was successfully parsed
  [[nodiscard]] bool valid() const noexcept { return _invalidReason.empty(); }

  // If not valid(), get the reason for invalidity
  [[nodiscard]] std::string_view invalidReason() const noexcept { return _invalidReason; }

 private:
  void parse(std::string_view contentTypeHeader, std::string_view body, const MultipartFormDataOptions& options);

  vector<Part> _parts;
  vector<http::HeaderView> _headers;
  std::string_view _invalidReason;  // empty if valid
};

// Extracts the boundary parameter of a multipart/form-data Content-Type, or an empty string_view if the media type
// is not multipart/form-data or has no boundary.
std::string_view ExtractMultipartBoundary(std::string_view contentType);

}  // namespace psdconv
