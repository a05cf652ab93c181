#include "psdconv/http-request.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>

#include "psdconv/http-constants.hpp"
#include "psdconv/http-header.hpp"
#include "psdconv/http-method.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/log.hpp"
#include "psdconv/string-equal-ignore-case.hpp"
#include "psdconv/string-trim.hpp"

namespace psdconv {

namespace {

// Returns true if the comma separated header value contains the given token (case-insensitive).
bool HasToken(std::string_view headerValue, std::string_view token) {
  while (!headerValue.empty()) {
    const auto comma = headerValue.find(',');
    const auto item = TrimOws(headerValue.substr(0, comma));
    if (CaseInsensitiveEqual(item, token)) {
      return true;
    }
    if (comma == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(comma + 1);
  }
  return false;
}

}  // namespace

std::optional<std::string_view> HttpRequest::headerValue(std::string_view headerKey) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [headerKey](const http::HeaderView& header) { return CaseInsensitiveEqual(header.name, headerKey); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->value;
}

std::string_view HttpRequest::headerValueOrEmpty(std::string_view headerKey) const noexcept {
  return headerValue(headerKey).value_or(std::string_view{});
}

bool HttpRequest::hasExpectContinue() const noexcept {
  return _version == http::Version::Http11 && CaseInsensitiveEqual(headerValueOrEmpty(http::Expect), http::h100_continue);
}

bool HttpRequest::wantClose() const noexcept {
  const auto connection = headerValueOrEmpty(http::Connection);
  if (HasToken(connection, http::close)) {
    return true;
  }
  return _version == http::Version::Http10 && !HasToken(connection, http::keepalive);
}

http::StatusCode HttpRequest::setHead(std::string_view head) {
  _headers.clear();
  _body = {};
  _headSpanSize = head.size();

  if (!head.ends_with(http::DoubleCRLF)) {
    return kStatusNeedMoreData;
  }
  head.remove_suffix(http::CRLF.size());

  // Request line: METHOD SP request-target SP HTTP-version CRLF
  const auto lineEnd = head.find(http::CRLF);
  std::string_view requestLine = head.substr(0, lineEnd);
  head.remove_prefix(lineEnd + http::CRLF.size());

  const auto firstSpace = requestLine.find(' ');
  if (firstSpace == std::string_view::npos) {
    return http::StatusCodeBadRequest;
  }
  const auto secondSpace = requestLine.find(' ', firstSpace + 1);
  if (secondSpace == std::string_view::npos) {
    return http::StatusCodeBadRequest;
  }

  const auto methodOpt = http::MethodStrToOpt(requestLine.substr(0, firstSpace));
  if (!methodOpt) {
    log::debug("Unsupported method in request line '{}'", requestLine);
    return http::StatusCodeNotImplemented;
  }
  _method = *methodOpt;

  const auto target = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
  if (target.empty() || target.front() != '/') {
    return http::StatusCodeBadRequest;
  }
  const auto questionMark = target.find('?');
  _path = target.substr(0, questionMark);
  _query = questionMark == std::string_view::npos ? std::string_view{} : target.substr(questionMark + 1);

  const auto versionStr = requestLine.substr(secondSpace + 1);
  if (versionStr == http::HTTP11Sv) {
    _version = http::Version::Http11;
  } else if (versionStr == http::HTTP10Sv) {
    _version = http::Version::Http10;
  } else if (versionStr.starts_with("HTTP/")) {
    return http::StatusCodeHTTPVersionNotSupported;
  } else {
    return http::StatusCodeBadRequest;
  }

  // Header lines, each terminated by CRLF.
  bool contentLengthSeen = false;
  while (!head.empty()) {
    const auto eol = head.find(http::CRLF);
    const auto line = head.substr(0, eol);
    head.remove_prefix(eol + http::CRLF.size());

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      return http::StatusCodeBadRequest;
    }
    // No whitespace allowed between the field name and colon (RFC 9112 5.1), which also rejects obs-fold.
    const auto name = line.substr(0, colon);
    if (!http::IsValidHeaderName(name)) {
      return http::StatusCodeBadRequest;
    }
    const auto value = TrimOws(line.substr(colon + 1));
    if (!http::IsValidHeaderValue(value)) {
      return http::StatusCodeBadRequest;
    }
    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      if (contentLengthSeen) {
        return http::StatusCodeBadRequest;
      }
      contentLengthSeen = true;
    }
    _headers.emplace_back(name, value);
  }

  return http::StatusCodeOK;
}

}  // namespace psdconv
