#include "psdconv/http-response.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/http-constants.hpp"
#include "psdconv/http-header.hpp"
#include "psdconv/string-equal-ignore-case.hpp"
#include "psdconv/timedef.hpp"

namespace psdconv {

bool IsReservedResponseHeader(std::string_view name) noexcept {
  return CaseInsensitiveEqual(name, http::ContentLength) || CaseInsensitiveEqual(name, http::Date) ||
         CaseInsensitiveEqual(name, http::Connection) || CaseInsensitiveEqual(name, http::TransferEncoding);
}

HttpResponse::HttpResponse(http::StatusCode statusCode, std::string body, std::string_view contentType)
    : _statusCode(statusCode) {
  this->body(std::move(body), contentType);
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument(std::format("header has invalid name: '{}'", name));
  }
  if (IsReservedResponseHeader(name)) {
    throw std::invalid_argument(std::format("attempt to set reserved header: '{}'", name));
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument(std::format("header has invalid value: '{}'", value));
  }
  auto it = std::ranges::find_if(_headers,
                                 [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(name), std::string(value));
  } else {
    it->value.assign(value);
  }
  return *this;
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) {
  _body = std::move(body);
  return header(http::ContentType, contentType);
}

void HttpResponse::appendTo(std::string& out, std::span<const http::Header> globalHeaders, bool closeConnection,
                            bool headRequest, SysTimePoint now) const {
  auto reason = http::ReasonPhraseFor(_statusCode);
  out.reserve(out.size() + 256U + (headRequest ? 0U : _body.size()));

  auto inserter = std::back_inserter(out);
  std::format_to(inserter, "{} {}", http::HTTP11Sv, _statusCode);
  if (!reason.empty()) {
    out.push_back(' ');
    out.append(reason);
  }
  out.append(http::CRLF);

  const auto appendHeader = [&out](std::string_view name, std::string_view value) {
    out.append(name);
    out.append(http::HeaderSep);
    out.append(value);
    out.append(http::CRLF);
  };

  for (const http::Header& header : _headers) {
    appendHeader(header.name, header.value);
  }
  for (const http::Header& header : globalHeaders) {
    if (!headerValue(header.name)) {
      appendHeader(header.name, header.value);
    }
  }

  // RFC 7231 IMF-fixdate, always GMT.
  std::format_to(inserter, "{}{}{:%a, %d %b %Y %H:%M:%S} GMT{}", http::Date, http::HeaderSep,
                 std::chrono::floor<std::chrono::seconds>(now), http::CRLF);
  std::format_to(inserter, "{}{}{}{}", http::ContentLength, http::HeaderSep, _body.size(), http::CRLF);
  if (closeConnection) {
    appendHeader(http::Connection, http::close);
  }
  out.append(http::CRLF);

  if (!headRequest) {
    out.append(_body);
  }
}

}  // namespace psdconv
