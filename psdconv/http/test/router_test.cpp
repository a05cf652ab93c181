#include "psdconv/router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "psdconv/http-method.hpp"
#include "psdconv/http-request.hpp"
#include "psdconv/http-response.hpp"
#include "psdconv/http-status-code.hpp"

using namespace psdconv;

namespace {
Router::RequestHandler StatusHandler(http::StatusCode status) {
  return [status](const HttpRequest&) { return HttpResponse(status); };
}

http::StatusCode Call(const Router::RoutingResult& result) {
  HttpRequest request;
  return (*result.pRequestHandler)(request).statusCode();
}
}  // namespace

TEST(RouterTest, ExactPathAndMethod) {
  Router router;
  router.setPath(http::Method::GET, "/health", StatusHandler(200));
  router.setPath(http::Method::POST | http::Method::PUT, "/convert", StatusHandler(201));

  auto result = router.match(http::Method::GET, "/health");
  ASSERT_NE(result.pRequestHandler, nullptr);
  EXPECT_EQ(Call(result), 200);

  result = router.match(http::Method::PUT, "/convert");
  ASSERT_NE(result.pRequestHandler, nullptr);
  EXPECT_EQ(Call(result), 201);

  result = router.match(http::Method::GET, "/health/");
  EXPECT_EQ(result.pRequestHandler, nullptr);
  EXPECT_FALSE(result.methodNotAllowed());
}

TEST(RouterTest, MethodNotAllowedReportsAllowedMethods) {
  Router router;
  router.setPath(http::Method::POST, "/convert", StatusHandler(200));

  const auto result = router.match(http::Method::GET, "/convert");
  EXPECT_EQ(result.pRequestHandler, nullptr);
  EXPECT_TRUE(result.methodNotAllowed());
  EXPECT_EQ(result.allowedMethods, static_cast<http::MethodBmp>(http::Method::POST));
}

TEST(RouterTest, HeadFallsBackToGet) {
  Router router;
  router.setPath(http::Method::GET, "/", StatusHandler(200));
  const auto result = router.match(http::Method::HEAD, "/");
  ASSERT_NE(result.pRequestHandler, nullptr);

  const auto postResult = router.match(http::Method::POST, "/");
  EXPECT_TRUE(http::IsMethodSet(postResult.allowedMethods, http::Method::HEAD));
  EXPECT_TRUE(http::IsMethodSet(postResult.allowedMethods, http::Method::GET));
}

TEST(RouterTest, LaterRegistrationReplacesHandler) {
  Router router;
  router.setPath(http::Method::GET, "/x", StatusHandler(200));
  router.setPath(http::Method::GET, "/x", StatusHandler(202));
  EXPECT_EQ(Call(router.match(http::Method::GET, "/x")), 202);
}

TEST(RouterTest, DefaultHandlerForUnknownPath) {
  Router router;
  router.setDefault(StatusHandler(418));
  const auto result = router.match(http::Method::DELETE, "/anything");
  ASSERT_NE(result.pRequestHandler, nullptr);
  EXPECT_EQ(Call(result), 418);
}

TEST(RouterTest, InvalidRegistrations) {
  Router router;
  EXPECT_THROW(router.setPath(http::Method::GET, "health", StatusHandler(200)), std::invalid_argument);
  EXPECT_THROW(router.setPath(http::Method::GET, "/health", Router::RequestHandler{}), std::invalid_argument);
}
