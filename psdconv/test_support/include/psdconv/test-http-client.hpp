#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "psdconv/base-fd.hpp"

namespace psdconv::test {

struct ParsedResponse {
  int statusCode{0};
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  // Case-insensitive header lookup.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

// Blocking loopback client connection with a receive timeout.
class ClientConnection {
 public:
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = std::chrono::seconds{10});

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

  // Sends all data, throws std::system_error on failure.
  void sendAll(std::string_view data) const;

  // Reads until the peer closes the connection (or the timeout expires) and returns everything received.
  [[nodiscard]] std::string recvUntilClose() const;

  // Reads exactly one complete response (head + Content-Length body).
  // Throws std::runtime_error on timeout or premature close.
  [[nodiscard]] ParsedResponse readResponse();

 private:
  BaseFd _fd;
  std::string _pending;
};

// Parses one response from raw bytes. Returns std::nullopt if incomplete or malformed.
std::optional<ParsedResponse> ParseResponse(std::string_view raw);

struct MultipartFile {
  std::string fieldName{"files"};
  std::string filename;
  std::string content;
  std::string contentType{"application/octet-stream"};
};

inline constexpr std::string_view kTestBoundary = "psdconvTestBoundary7MA4YWxkTrZu0gW";

// Builds a multipart/form-data body delimited by kTestBoundary.
std::string BuildMultipartBody(const std::vector<MultipartFile>& files);

// Content-Type header value matching BuildMultipartBody.
std::string MultipartContentType();

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  // Adds Content-Length when the body is not empty or the method is POST.
  bool addContentLength{true};
};

// Sends one request with "Connection: close" on a new connection and parses the response.
// Throws std::runtime_error if no complete response is received.
ParsedResponse Request(uint16_t port, const RequestOptions& options);

// Posts files as multipart/form-data to the given target.
ParsedResponse PostFiles(uint16_t port, std::string_view target, const std::vector<MultipartFile>& files);

}  // namespace psdconv::test
