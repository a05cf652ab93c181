#include "psdconv/convert-service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "psdconv/converter-config.hpp"
#include "psdconv/fake-rasterizer.hpp"
#include "psdconv/http-request.hpp"
#include "psdconv/http-server-config.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/router.hpp"
#include "psdconv/temp-dir.hpp"
#include "psdconv/test-http-client.hpp"
#include "psdconv/test-server.hpp"
#include "psdconv/zip-reader.hpp"

namespace psdconv {

namespace {

constexpr std::size_t kMiB = 1024UL * 1024UL;

Router MakeRouter(const ConvertService& service) {
  Router router;
  service.registerRoutes(router);
  return router;
}

class ConvertServiceTest : public ::testing::Test {
 protected:
  // The HTTP body cap is the total size limit plus 'extraBodyBytes'.
  explicit ConvertServiceTest(ConverterConfig config = {}, std::size_t extraBodyBytes = 0)
      : service(config.withUploadDir(tmpDir.makeSubDir("uploads")).withConvertedDir(tmpDir.makeSubDir("converted")),
                rasterizer),
        ts(HttpServerConfig{}.withMaxBodyBytes(service.config().maxTotalRequestBytes + extraBodyBytes),
           MakeRouter(service)) {}

  test::ParsedResponse post(const std::vector<test::MultipartFile>& files, std::string_view target = "/convert") {
    return test::PostFiles(ts.port(), target, files);
  }

  [[nodiscard]] bool workingDirsEmpty() const {
    return std::filesystem::is_empty(service.config().uploadDir) &&
           std::filesystem::is_empty(service.config().convertedDir);
  }

  test::ScopedTempDir tmpDir;
  test::FakeRasterizer rasterizer;
  ConvertService service;
  test::TestServer ts;
};

ConverterConfig SmallLimits() {
  return ConverterConfig{}.withMaxFilesCount(2).withMaxSingleFileBytes(2 * kMiB).withMaxTotalRequestBytes(3 * kMiB);
}

// Body cap above the total size limit so that the aggregated size check is reachable.
class SmallLimitsConvertServiceTest : public ConvertServiceTest {
 protected:
  SmallLimitsConvertServiceTest() : ConvertServiceTest(SmallLimits(), 4 * kMiB) {}
};

class BodyCapConvertServiceTest : public ConvertServiceTest {
 protected:
  BodyCapConvertServiceTest() : ConvertServiceTest(SmallLimits()) {}
};

}  // namespace

TEST_F(ConvertServiceTest, Health) {
  const auto resp = test::Request(ts.port(), {.method = "GET", .target = "/health"});
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Type"), "application/json");
  EXPECT_EQ(resp.body, R"({"status":"healthy"})");
}

TEST_F(ConvertServiceTest, Config) {
  const auto resp = test::Request(ts.port(), {.method = "GET", .target = "/config"});
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.body,
            R"({"max_total_request_size_mb":500,"max_single_file_size_mb":100,"max_files_count":100,)"
            R"("conversion_timeout_seconds":30})");
}

TEST_F(ConvertServiceTest, LandingPage) {
  const auto resp = test::Request(ts.port(), {.method = "GET", .target = "/"});
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Type"), "text/html; charset=utf-8");
  EXPECT_TRUE(resp.body.contains("Maximum number of files: 100"));
}

TEST_F(ConvertServiceTest, ConvertGetIsNotAllowed) {
  const auto resp = test::Request(ts.port(), {.method = "GET", .target = "/convert"});
  EXPECT_EQ(resp.statusCode, 405);
}

TEST_F(ConvertServiceTest, ConvertsBatchIntoZip) {
  const auto resp = post({{.filename = "first.psd", .content = "one"}, {.filename = "Второй файл.psd", .content = "two"}});
  ASSERT_EQ(resp.statusCode, 200) << resp.body;
  EXPECT_EQ(resp.header("Content-Type"), "application/zip");
  EXPECT_EQ(resp.header("Content-Disposition"), "attachment; filename=converted_2_files.zip");

  const auto entries = test::ReadZip(resp.body);
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].name, "first.png");
  EXPECT_EQ(entries[0].content, test::FakeRasterizer::OutputContentFor("one"));
  EXPECT_EQ(entries[1].name, "Второй_файл.png");
  EXPECT_EQ(entries[1].content, test::FakeRasterizer::OutputContentFor("two"));

  EXPECT_TRUE(workingDirsEmpty());
}

TEST_F(ConvertServiceTest, ApiAlias) {
  const auto resp = post({{.filename = "a.psd", .content = "x"}}, "/api/convert");
  ASSERT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Disposition"), "attachment; filename=converted_1_files.zip");
  EXPECT_EQ(test::ReadZip(resp.body).size(), 1U);
}

TEST_F(ConvertServiceTest, PartialFailureStillSucceeds) {
  rasterizer.setBehaviorFor("bad", test::FakeRasterizer::Behavior::Fail);
  const auto resp = post({{.filename = "good.psd", .content = "g"}, {.filename = "bad.psd", .content = "b"}});
  ASSERT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Disposition"), "attachment; filename=converted_1_files.zip");
  const auto entries = test::ReadZip(resp.body);
  ASSERT_EQ(entries.size(), 1U);
  EXPECT_EQ(entries[0].name, "good.png");
  EXPECT_TRUE(workingDirsEmpty());
}

TEST_F(ConvertServiceTest, TotalFailure) {
  rasterizer.setBehaviorFor("", test::FakeRasterizer::Behavior::Timeout);
  const auto resp = post({{.filename = "a b.psd", .content = "1"}, {.filename = "c.psd", .content = "2"}});
  EXPECT_EQ(resp.statusCode, 500);
  EXPECT_EQ(resp.header("Content-Type"), "application/json");
  EXPECT_EQ(resp.body, R"({"error":"No files were successfully converted","failed_files":["a_b.psd","c.psd"]})");
  EXPECT_TRUE(workingDirsEmpty());
}

TEST_F(ConvertServiceTest, WrongExtensionIsRejectedBeforeConversion) {
  const auto resp = post({{.filename = "a.psd", .content = "1"}, {.filename = "photo.jpg", .content = "2"}});
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_EQ(resp.body, R"({"error":"Validation failed","details":["File photo.jpg is not in PSD format"]})");
  EXPECT_EQ(rasterizer.nbCalls(), 0U);
  EXPECT_TRUE(workingDirsEmpty());
}

TEST_F(ConvertServiceTest, MissingFilesField) {
  const auto resp = post({{.fieldName = "other", .filename = "a.psd", .content = "1"}});
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_EQ(resp.body, R"({"error":"No files provided"})");
}

TEST_F(ConvertServiceTest, NotMultipart) {
  const auto resp = test::Request(ts.port(), {.method = "POST",
                                              .target = "/convert",
                                              .headers = {{"Content-Type", "application/json"}},
                                              .body = "{}"});
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_EQ(resp.body, R"({"error":"No files provided"})");
}

TEST_F(ConvertServiceTest, EmptyFirstFilename) {
  const auto resp = post({{.filename = "", .content = ""}, {.filename = "a.psd", .content = "1"}});
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_EQ(resp.body, R"({"error":"No selected files"})");
  EXPECT_EQ(rasterizer.nbCalls(), 0U);
}

TEST_F(ConvertServiceTest, EmptyLaterFilenameIsSkipped) {
  const auto resp = post({{.filename = "a.psd", .content = "1"}, {.filename = "", .content = "ignored"}});
  ASSERT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Disposition"), "attachment; filename=converted_1_files.zip");
  EXPECT_EQ(rasterizer.nbCalls(), 1U);
}

TEST_F(ConvertServiceTest, MalformedMultipartBody) {
  const auto resp = test::Request(ts.port(), {.method = "POST",
                                              .target = "/convert",
                                              .headers = {{"Content-Type", test::MultipartContentType()}},
                                              .body = "garbage without any boundary"});
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_TRUE(resp.body.starts_with(R"({"error":"Invalid multipart/form-data body: )")) << resp.body;
}

TEST_F(ConvertServiceTest, ExpiredWorkingFilesAreSweptOnConvert) {
  const auto stale = tmpDir.writeFile("converted/stale.png", "old");
  // Status change time cannot be set from user space: age the file by moving the retention period instead.
  ConvertService shortRetention(
      ConverterConfig{service.config()}.withRetentionPeriod(std::chrono::seconds{1}), rasterizer);
  std::this_thread::sleep_for(std::chrono::milliseconds{1100});

  EXPECT_EQ(shortRetention.handleConvert(HttpRequest{}).statusCode(), http::StatusCodeBadRequest);
  EXPECT_FALSE(std::filesystem::exists(stale));
}

TEST_F(SmallLimitsConvertServiceTest, TooManyFiles) {
  const auto resp = post({{.filename = "a.psd", .content = "1"},
                          {.filename = "b.psd", .content = "2"},
                          {.filename = "c.txt", .content = "3"}});
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_EQ(resp.body, R"({"error":"Validation failed","details":["Too many files. Maximum: 2"]})");
  EXPECT_EQ(rasterizer.nbCalls(), 0U);
}

TEST_F(SmallLimitsConvertServiceTest, SizeLimits) {
  const std::string big(2 * kMiB + 1, 'p');
  const std::string medium(kMiB + kMiB / 2, 'q');
  const auto resp = post({{.filename = "big.psd", .content = big}, {.filename = "medium.psd", .content = medium}});
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_EQ(resp.body,
            R"({"error":"Validation failed","details":["File big.psd is too large (2MB). Maximum: 2MB",)"
            R"("Total size of files (3MB) exceeds the limit (3MB)"]})");
  EXPECT_EQ(rasterizer.nbCalls(), 0U);
}

TEST_F(BodyCapConvertServiceTest, BodyOverTotalLimitIs413) {
  test::ClientConnection cnx(ts.port());
  // Only the head is sent: the announced length alone exceeds the total size limit.
  cnx.sendAll(std::format("POST /convert HTTP/1.1\r\nHost: x\r\nContent-Type: {}\r\nContent-Length: {}\r\n\r\n",
                          test::MultipartContentType(), 3 * kMiB + 1));
  const auto resp = cnx.readResponse();
  EXPECT_EQ(resp.statusCode, 413);
  EXPECT_EQ(rasterizer.nbCalls(), 0U);
}

TEST(ConvertService, InvalidConfigThrows) {
  test::FakeRasterizer rasterizer;
  EXPECT_THROW(ConvertService(ConverterConfig{}.withMaxFilesCount(0), rasterizer), std::invalid_argument);
}

}  // namespace psdconv
