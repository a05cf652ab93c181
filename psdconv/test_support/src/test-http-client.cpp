#include "psdconv/test-http-client.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "psdconv/errno-throw.hpp"
#include "psdconv/socket-ops.hpp"
#include "psdconv/string-equal-ignore-case.hpp"
#include "psdconv/string-trim.hpp"

namespace psdconv::test {

std::optional<std::string_view> ParsedResponse::header(std::string_view name) const {
  const auto it = std::ranges::find_if(headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_fd) {
    throw_errno("socket failed");
  }
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  ::setsockopt(_fd.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(_fd.fd(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  if (::connect(_fd.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("connect to port {} failed", port);
  }
}

void ClientConnection::sendAll(std::string_view data) const {
  while (!data.empty()) {
    const auto nbSent = SafeSend(_fd.fd(), data);
    if (nbSent < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("send failed");
    }
    data.remove_prefix(static_cast<std::size_t>(nbSent));
  }
}

std::string ClientConnection::recvUntilClose() const {
  std::string out;
  char buf[16384];
  while (true) {
    const auto nbRead = SafeRecv(_fd.fd(), buf, sizeof(buf));
    if (nbRead > 0) {
      out.append(buf, static_cast<std::size_t>(nbRead));
      continue;
    }
    if (nbRead < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  return out;
}

ParsedResponse ClientConnection::readResponse() {
  char buf[16384];
  while (true) {
    // Interim 1xx responses are skipped.
    while (_pending.starts_with("HTTP/1.1 1")) {
      const auto end = _pending.find("\r\n\r\n");
      if (end == std::string::npos) {
        break;
      }
      _pending.erase(0, end + 4);
    }
    if (auto parsed = ParseResponse(_pending)) {
      const auto headEnd = _pending.find("\r\n\r\n") + 4;
      _pending.erase(0, headEnd + parsed->body.size());
      return *parsed;
    }
    const auto nbRead = SafeRecv(_fd.fd(), buf, sizeof(buf));
    if (nbRead > 0) {
      _pending.append(buf, static_cast<std::size_t>(nbRead));
      continue;
    }
    if (nbRead < 0 && errno == EINTR) {
      continue;
    }
    throw std::runtime_error(std::format("Incomplete response ({} bytes received)", _pending.size()));
  }
}

std::optional<ParsedResponse> ParseResponse(std::string_view raw) {
  const auto headEnd = raw.find("\r\n\r\n");
  if (headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view head = raw.substr(0, headEnd + 2);
  ParsedResponse response;

  const auto statusLineEnd = head.find("\r\n");
  const auto statusLine = head.substr(0, statusLineEnd);
  head.remove_prefix(statusLineEnd + 2);
  if (!statusLine.starts_with("HTTP/1.") || statusLine.size() < 12) {
    return std::nullopt;
  }
  const auto codeStr = statusLine.substr(9, 3);
  if (std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), response.statusCode).ec != std::errc()) {
    return std::nullopt;
  }
  if (statusLine.size() > 13) {
    response.reason.assign(statusLine.substr(13));
  }

  std::size_t contentLength = 0;
  while (!head.empty()) {
    const auto eol = head.find("\r\n");
    const auto line = head.substr(0, eol);
    head.remove_prefix(eol + 2);
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      return std::nullopt;
    }
    auto& header = response.headers.emplace_back(std::string(line.substr(0, colon)),
                                                 std::string(TrimOws(line.substr(colon + 1))));
    if (CaseInsensitiveEqual(header.first, "Content-Length")) {
      std::from_chars(header.second.data(), header.second.data() + header.second.size(), contentLength);
    }
  }

  const auto body = raw.substr(headEnd + 4);
  if (body.size() < contentLength) {
    return std::nullopt;
  }
  response.body.assign(body.substr(0, contentLength));
  return response;
}

std::string BuildMultipartBody(const std::vector<MultipartFile>& files) {
  std::string body;
  for (const auto& file : files) {
    body.append(std::format("--{}\r\nContent-Disposition: form-data; name=\"{}\"; filename=\"{}\"\r\n"
                            "Content-Type: {}\r\n\r\n",
                            kTestBoundary, file.fieldName, file.filename, file.contentType));
    body.append(file.content);
    body.append("\r\n");
  }
  body.append(std::format("--{}--\r\n", kTestBoundary));
  return body;
}

std::string MultipartContentType() { return std::format("multipart/form-data; boundary={}", kTestBoundary); }

ParsedResponse Request(uint16_t port, const RequestOptions& options) {
  std::string raw = std::format("{} {} HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n", options.method,
                                options.target);
  for (const auto& [name, value] : options.headers) {
    raw.append(std::format("{}: {}\r\n", name, value));
  }
  if (options.addContentLength && (!options.body.empty() || options.method == "POST")) {
    raw.append(std::format("Content-Length: {}\r\n", options.body.size()));
  }
  raw.append("\r\n");
  raw.append(options.body);

  ClientConnection cnx(port);
  cnx.sendAll(raw);
  return cnx.readResponse();
}

ParsedResponse PostFiles(uint16_t port, std::string_view target, const std::vector<MultipartFile>& files) {
  RequestOptions options;
  options.method = "POST";
  options.target = std::string(target);
  options.headers.emplace_back("Content-Type", MultipartContentType());
  options.body = BuildMultipartBody(files);
  return Request(port, options);
}

}  // namespace psdconv::test
