#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "psdconv/http-header.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/timedef.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

// HTTP/1.1 response built by handlers with a fluent interface:
//   return HttpResponse(http::StatusCodeOK).header("X-Foo", "bar").body(std::move(json), "application/json");
// Content-Length, Date and Connection are reserved and computed at serialization.
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode statusCode = http::StatusCodeOK) noexcept : _statusCode(statusCode) {}

  HttpResponse(http::StatusCode statusCode, std::string body, std::string_view contentType);

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Get the value of the given header (case-insensitive lookup), or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  HttpResponse& status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Sets a header, replacing any previous value of the same name (case-insensitive).
  // Throws std::invalid_argument for invalid or reserved names and invalid values.
  HttpResponse& header(std::string_view name, std::string_view value);

  // Sets the body and its Content-Type.
  HttpResponse& body(std::string body, std::string_view contentType);

  // Appends the serialized response to 'out'.
  //  - globalHeaders are emitted unless the response defines a header with the same name.
  //  - closeConnection adds "Connection: close".
  //  - headRequest omits the body (Content-Length is kept).
  void appendTo(std::string& out, std::span<const http::Header> globalHeaders, bool closeConnection, bool headRequest,
                SysTimePoint now) const;

 private:
  vector<http::Header> _headers;
  std::string _body;
  http::StatusCode _statusCode;
};

// Tells whether the header name is computed by the server and cannot be set by handlers or global headers.
bool IsReservedResponseHeader(std::string_view name) noexcept;

}  // namespace psdconv
