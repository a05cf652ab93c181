#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "psdconv/http-header.hpp"
#include "psdconv/http-method.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

namespace http {
enum class Version : uint8_t { Http10, Http11 };
}  // namespace http

// Read-only view of a parsed HTTP/1.x request.
// All string_views point into the connection buffer that was given to setHead / setBody: the request must not
// outlive it.
class HttpRequest {
 public:
  static constexpr http::StatusCode kStatusNeedMoreData = static_cast<http::StatusCode>(0);

  HttpRequest() noexcept = default;

  // Get the value of the given header (case-insensitive lookup), or an empty string_view if absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept;

  // Get the value of the given header (case-insensitive lookup), or std::nullopt if absent.
  // An empty but present header returns an empty string_view.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept;

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Request target without the query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string (without the '?'), empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  [[nodiscard]] std::span<const http::HeaderView> headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Size of the request head, including the terminating blank line.
  [[nodiscard]] std::size_t headSpanSize() const noexcept { return _headSpanSize; }

  // Tells whether the client asked for "Expect: 100-continue".
  [[nodiscard]] bool hasExpectContinue() const noexcept;

  // Tells whether the connection should be closed after the response, based on the version and Connection header.
  [[nodiscard]] bool wantClose() const noexcept;

  // Parses the request line and headers from 'head', which must contain exactly the request head terminated by
  // CRLFCRLF. Returns StatusCodeOK on success, or the status code of the error response to send.
  http::StatusCode setHead(std::string_view head);

  void setBody(std::string_view body) noexcept { _body = body; }

 private:
  vector<http::HeaderView> _headers;
  std::string_view _path;
  std::string_view _query;
  std::string_view _body;
  std::size_t _headSpanSize{0};
  http::Method _method{http::Method::GET};
  http::Version _version{http::Version::Http11};
};

}  // namespace psdconv
