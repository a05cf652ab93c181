#include "psdconv/service-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>

#include "psdconv/converter-config.hpp"
#include "psdconv/log.hpp"
#include "psdconv/scoped-env-var.hpp"

namespace psdconv {

namespace {

// Clears every variable read by LoadServiceConfigFromEnv for the duration of a test.
class ServiceConfigTest : public ::testing::Test {
 protected:
  test::ScopedEnvVar maxTotal{"MAX_TOTAL_REQUEST_SIZE", std::nullopt};
  test::ScopedEnvVar maxSingle{"MAX_SINGLE_FILE_SIZE", std::nullopt};
  test::ScopedEnvVar maxCount{"MAX_FILES_COUNT", std::nullopt};
  test::ScopedEnvVar timeout{"CONVERSION_TIMEOUT", std::nullopt};
  test::ScopedEnvVar uploadFolder{"UPLOAD_FOLDER", std::nullopt};
  test::ScopedEnvVar convertedFolder{"CONVERTED_FOLDER", std::nullopt};
  test::ScopedEnvVar rasterizer{"RASTERIZER", std::nullopt};
  test::ScopedEnvVar port{"PORT", std::nullopt};
  test::ScopedEnvVar workers{"WORKERS", std::nullopt};
  test::ScopedEnvVar logLevel{"LOG_LEVEL", std::nullopt};
};

void ExpectInvalid(const char* name, const char* value) {
  test::ScopedEnvVar envVar(name, value);
  try {
    std::ignore = LoadServiceConfigFromEnv();
    ADD_FAILURE() << name << "=" << value << " should be rejected";
  } catch (const std::invalid_argument& ex) {
    EXPECT_TRUE(std::string(ex.what()).contains(name)) << ex.what();
  }
}

}  // namespace

TEST_F(ServiceConfigTest, Defaults) {
  const ServiceConfig config = LoadServiceConfigFromEnv();
  EXPECT_EQ(config.converter.maxTotalRequestBytes, 500UL * kBytesPerMiB);
  EXPECT_EQ(config.converter.maxSingleFileBytes, 100UL * kBytesPerMiB);
  EXPECT_EQ(config.converter.maxFilesCount, 100U);
  EXPECT_EQ(config.converter.conversionTimeout, std::chrono::seconds{30});
  EXPECT_EQ(config.converter.rasterizerProgram, "convert");
  EXPECT_EQ(config.http.port, 5000);
  EXPECT_EQ(config.http.nbThreads, 2U);
  EXPECT_EQ(config.http.maxBodyBytes, config.converter.maxTotalRequestBytes);
  EXPECT_EQ(config.logLevel, log::level::info);
}

TEST_F(ServiceConfigTest, ReadsEnvironment) {
  test::ScopedEnvVar total("MAX_TOTAL_REQUEST_SIZE", "1Gi");
  test::ScopedEnvVar single("MAX_SINGLE_FILE_SIZE", "52428800");
  test::ScopedEnvVar count("MAX_FILES_COUNT", "5");
  test::ScopedEnvVar conversionTimeout("CONVERSION_TIMEOUT", "90");
  test::ScopedEnvVar upload("UPLOAD_FOLDER", "/app/uploads");
  test::ScopedEnvVar converted("CONVERTED_FOLDER", "/app/converted");
  test::ScopedEnvVar program("RASTERIZER", "/usr/bin/magick");
  test::ScopedEnvVar listenPort("PORT", "8080");
  test::ScopedEnvVar nbWorkers("WORKERS", "4");
  test::ScopedEnvVar level("LOG_LEVEL", "debug");

  const ServiceConfig config = LoadServiceConfigFromEnv();
  EXPECT_EQ(config.converter.maxTotalRequestBytes, 1024UL * kBytesPerMiB);
  EXPECT_EQ(config.converter.maxSingleFileBytes, 50UL * kBytesPerMiB);
  EXPECT_EQ(config.converter.maxFilesCount, 5U);
  EXPECT_EQ(config.converter.conversionTimeout, std::chrono::seconds{90});
  EXPECT_EQ(config.converter.uploadDir, "/app/uploads");
  EXPECT_EQ(config.converter.convertedDir, "/app/converted");
  EXPECT_EQ(config.converter.rasterizerProgram, "/usr/bin/magick");
  EXPECT_EQ(config.http.port, 8080);
  EXPECT_EQ(config.http.nbThreads, 4U);
  EXPECT_EQ(config.http.maxBodyBytes, 1024UL * kBytesPerMiB);
  EXPECT_EQ(config.logLevel, log::level::debug);
}

TEST_F(ServiceConfigTest, EmptyValuesAreIgnored) {
  test::ScopedEnvVar count("MAX_FILES_COUNT", "");
  EXPECT_EQ(LoadServiceConfigFromEnv().converter.maxFilesCount, 100U);
}

TEST_F(ServiceConfigTest, InvalidValues) {
  ExpectInvalid("MAX_TOTAL_REQUEST_SIZE", "lots");
  ExpectInvalid("MAX_TOTAL_REQUEST_SIZE", "0");
  ExpectInvalid("MAX_SINGLE_FILE_SIZE", "-5");
  ExpectInvalid("MAX_FILES_COUNT", "ten");
  ExpectInvalid("MAX_FILES_COUNT", "10 ");
  ExpectInvalid("CONVERSION_TIMEOUT", "1.5");
  ExpectInvalid("PORT", "70000");
  ExpectInvalid("WORKERS", "-1");
  ExpectInvalid("LOG_LEVEL", "verbose");
}

TEST_F(ServiceConfigTest, ZeroCountIsRejectedByValidation) {
  test::ScopedEnvVar count("MAX_FILES_COUNT", "0");
  EXPECT_THROW(std::ignore = LoadServiceConfigFromEnv(), std::invalid_argument);
}

TEST(ServiceConfig, BodyLimitBelowTotalLimit) {
  ServiceConfig config;
  config.http.withMaxBodyBytes(10);
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.http.withMaxBodyBytes(config.converter.maxTotalRequestBytes);
  EXPECT_NO_THROW(config.validate());
}

}  // namespace psdconv
