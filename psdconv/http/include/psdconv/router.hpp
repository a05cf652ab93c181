#pragma once

#include <array>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/http-method.hpp"
#include "psdconv/http-request.hpp"
#include "psdconv/http-response.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

// Maps (method, exact path) to request handlers.
// HEAD requests fall back to the GET handler of the same path when no HEAD handler is registered.
class Router {
 public:
  using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

  Router() = default;

  // Register a handler for the given path and methods. A later registration for the same method and path replaces
  // the previous one.
  // Throws std::invalid_argument if path does not start with '/' or handler is empty.
  void setPath(http::MethodBmp methods, std::string_view path, RequestHandler handler);

  void setPath(http::Method method, std::string_view path, RequestHandler handler) {
    setPath(static_cast<http::MethodBmp>(method), path, std::move(handler));
  }

  // Handler used when no path matches (instead of the default 404 response).
  void setDefault(RequestHandler handler) { _defaultHandler = std::move(handler); }

  struct RoutingResult {
    // Handler to call, nullptr if none.
    const RequestHandler* pRequestHandler{nullptr};
    // Methods registered for the path when the path exists but not for the requested method.
    http::MethodBmp allowedMethods{0};

    [[nodiscard]] bool methodNotAllowed() const noexcept { return pRequestHandler == nullptr && allowedMethods != 0; }
  };

  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

 private:
  struct PathHandlerEntry {
    std::string path;
    std::array<RequestHandler, http::kNbMethods> handlers;
    http::MethodBmp methods{0};
  };

  vector<PathHandlerEntry> _entries;
  RequestHandler _defaultHandler;
};

}  // namespace psdconv
