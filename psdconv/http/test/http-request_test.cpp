#include "psdconv/http-request.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "psdconv/http-method.hpp"
#include "psdconv/http-status-code.hpp"

using namespace psdconv;

TEST(HttpRequestTest, ParsesRequestLineAndHeaders) {
  HttpRequest request;
  const std::string_view head =
      "POST /convert?x=1 HTTP/1.1\r\nHost: localhost\r\nContent-Type:  multipart/form-data; boundary=b \r\n"
      "Content-Length: 12\r\n\r\n";
  ASSERT_EQ(request.setHead(head), http::StatusCodeOK);
  EXPECT_EQ(request.method(), http::Method::POST);
  EXPECT_EQ(request.path(), "/convert");
  EXPECT_EQ(request.query(), "x=1");
  EXPECT_EQ(request.version(), http::Version::Http11);
  EXPECT_EQ(request.headers().size(), 3U);
  EXPECT_EQ(request.headerValueOrEmpty("content-type"), "multipart/form-data; boundary=b");
  EXPECT_EQ(request.headerValueOrEmpty("CONTENT-LENGTH"), "12");
  EXPECT_FALSE(request.headerValue("Missing").has_value());
  EXPECT_EQ(request.headSpanSize(), head.size());
  EXPECT_FALSE(request.wantClose());
}

TEST(HttpRequestTest, EmptyHeaderValueIsPresent) {
  HttpRequest request;
  ASSERT_EQ(request.setHead("GET / HTTP/1.1\r\nX-Empty:\r\n\r\n"), http::StatusCodeOK);
  ASSERT_TRUE(request.headerValue("X-Empty").has_value());
  EXPECT_TRUE(request.headerValue("X-Empty")->empty());
}

TEST(HttpRequestTest, NoHeaders) {
  HttpRequest request;
  ASSERT_EQ(request.setHead("GET /health HTTP/1.0\r\n\r\n"), http::StatusCodeOK);
  EXPECT_EQ(request.version(), http::Version::Http10);
  EXPECT_TRUE(request.headers().empty());
  EXPECT_TRUE(request.wantClose());
}

TEST(HttpRequestTest, IncompleteHeadNeedsMoreData) {
  HttpRequest request;
  EXPECT_EQ(request.setHead("GET / HTTP/1.1\r\nHost: a\r\n"), HttpRequest::kStatusNeedMoreData);
}

TEST(HttpRequestTest, UnknownMethodIsNotImplemented) {
  HttpRequest request;
  EXPECT_EQ(request.setHead("BREW /pot HTTP/1.1\r\n\r\n"), http::StatusCodeNotImplemented);
  EXPECT_EQ(request.setHead("get / HTTP/1.1\r\n\r\n"), http::StatusCodeNotImplemented);
}

TEST(HttpRequestTest, MalformedRequestLines) {
  HttpRequest request;
  EXPECT_EQ(request.setHead("GET\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(request.setHead("GET /\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(request.setHead("GET index.html HTTP/1.1\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(request.setHead("GET / FTP/1.1\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(request.setHead("GET / HTTP/2.0\r\n\r\n"), http::StatusCodeHTTPVersionNotSupported);
}

TEST(HttpRequestTest, MalformedHeaders) {
  HttpRequest request;
  EXPECT_EQ(request.setHead("GET / HTTP/1.1\r\nNoColon\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(request.setHead("GET / HTTP/1.1\r\nBad Name: v\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(request.setHead("GET / HTTP/1.1\r\n: v\r\n\r\n"), http::StatusCodeBadRequest);
  EXPECT_EQ(request.setHead("GET / HTTP/1.1\r\nHost: a\r\n folded\r\n\r\n"), http::StatusCodeBadRequest);
}

TEST(HttpRequestTest, DuplicateContentLengthIsRejected) {
  HttpRequest request;
  EXPECT_EQ(request.setHead("POST / HTTP/1.1\r\nContent-Length: 1\r\ncontent-length: 1\r\n\r\n"),
            http::StatusCodeBadRequest);
}

TEST(HttpRequestTest, ConnectionSemantics) {
  HttpRequest request;
  ASSERT_EQ(request.setHead("GET / HTTP/1.1\r\nConnection: keep-alive, Close\r\n\r\n"), http::StatusCodeOK);
  EXPECT_TRUE(request.wantClose());

  ASSERT_EQ(request.setHead("GET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n"), http::StatusCodeOK);
  EXPECT_FALSE(request.wantClose());
}

TEST(HttpRequestTest, ExpectContinue) {
  HttpRequest request;
  ASSERT_EQ(request.setHead("POST / HTTP/1.1\r\nExpect: 100-Continue\r\nContent-Length: 3\r\n\r\n"),
            http::StatusCodeOK);
  EXPECT_TRUE(request.hasExpectContinue());

  ASSERT_EQ(request.setHead("POST / HTTP/1.0\r\nExpect: 100-continue\r\nContent-Length: 3\r\n\r\n"),
            http::StatusCodeOK);
  EXPECT_FALSE(request.hasExpectContinue());
}

TEST(HttpRequestTest, BodyIsAttached) {
  HttpRequest request;
  ASSERT_EQ(request.setHead("POST / HTTP/1.1\r\nContent-Length: 3\r\n\r\n"), http::StatusCodeOK);
  request.setBody("abc");
  EXPECT_EQ(request.body(), "abc");
}
