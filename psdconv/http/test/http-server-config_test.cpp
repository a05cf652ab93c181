#include "psdconv/http-server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace psdconv {

TEST(HttpServerConfigTest, DefaultIsValid) {
  HttpServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.port, 0);
  EXPECT_EQ(config.nbThreads, 1U);
  ASSERT_EQ(config.globalHeaders.size(), 1U);
  EXPECT_EQ(config.globalHeaders.front().name, "Server");
}

TEST(HttpServerConfigTest, BuilderChaining) {
  HttpServerConfig config;
  config.withPort(8080)
      .withReusePort()
      .withTcpNoDelay()
      .withNbThreads(4)
      .withKeepAliveMode(false)
      .withMaxRequestsPerConnection(3)
      .withKeepAliveTimeout(std::chrono::milliseconds{250})
      .withMaxHeaderBytes(4096)
      .withMaxBodyBytes(1024)
      .withReadChunkBytes(512)
      .withPollInterval(std::chrono::milliseconds{20})
      .withGlobalHeader("X-Custom", "1");

  EXPECT_EQ(config.port, 8080);
  EXPECT_TRUE(config.reusePort);
  EXPECT_TRUE(config.tcpNoDelay);
  EXPECT_EQ(config.nbThreads, 4U);
  EXPECT_FALSE(config.enableKeepAlive);
  EXPECT_EQ(config.maxRequestsPerConnection, 3U);
  EXPECT_EQ(config.keepAliveTimeout, std::chrono::milliseconds{250});
  EXPECT_EQ(config.maxHeaderBytes, 4096U);
  EXPECT_EQ(config.maxBodyBytes, 1024U);
  EXPECT_EQ(config.readChunkBytes, 512U);
  EXPECT_EQ(config.pollInterval, std::chrono::milliseconds{20});
  ASSERT_EQ(config.globalHeaders.size(), 2U);
  EXPECT_EQ(config.globalHeaders.back().value, "1");
  EXPECT_NO_THROW(config.validate());
}

TEST(HttpServerConfigTest, InvalidValues) {
  EXPECT_THROW(HttpServerConfig{}.withNbThreads(0).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxHeaderBytes(64).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxBodyBytes(0).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withReadChunkBytes(0).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withMaxRequestsPerConnection(0).validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withKeepAliveTimeout(std::chrono::milliseconds{-1}).validate(),
               std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withPollInterval(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_NO_THROW(HttpServerConfig{}.withKeepAliveTimeout(std::chrono::milliseconds{0}).validate());
}

TEST(HttpServerConfigTest, InvalidGlobalHeaders) {
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("Bad Name", "v").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("X-Ok", "line\r\nbreak").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("Content-Length", "3").validate(), std::invalid_argument);
  EXPECT_THROW(HttpServerConfig{}.withGlobalHeader("connection", "close").validate(), std::invalid_argument);
}

}  // namespace psdconv
