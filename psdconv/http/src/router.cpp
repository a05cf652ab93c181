#include "psdconv/router.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "psdconv/http-method.hpp"
#include "psdconv/log.hpp"

namespace psdconv {

void Router::setPath(http::MethodBmp methods, std::string_view path, RequestHandler handler) {
  if (path.empty() || path.front() != '/') {
    throw std::invalid_argument("Router path must start with '/'");
  }
  if (!handler) {
    throw std::invalid_argument("Router handler cannot be empty");
  }

  auto it = std::ranges::find_if(_entries, [path](const PathHandlerEntry& entry) { return entry.path == path; });
  if (it == _entries.end()) {
    auto& entry = _entries.emplace_back();
    entry.path.assign(path);
    it = std::prev(_entries.end());
  }

  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const auto method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      if (http::IsMethodSet(it->methods, method)) {
        log::warn("Overwriting handler for {} {}", http::MethodToStr(method), path);
      }
      it->handlers[methodIdx] = handler;
    }
  }
  it->methods = static_cast<http::MethodBmp>(it->methods | methods);
}

Router::RoutingResult Router::match(http::Method method, std::string_view path) const {
  RoutingResult result;
  const auto it = std::ranges::find_if(_entries, [path](const PathHandlerEntry& entry) { return entry.path == path; });
  if (it == _entries.end()) {
    if (_defaultHandler) {
      result.pRequestHandler = &_defaultHandler;
    }
    return result;
  }

  if (http::IsMethodSet(it->methods, method)) {
    result.pRequestHandler = &it->handlers[http::MethodToIdx(method)];
  } else if (method == http::Method::HEAD && http::IsMethodSet(it->methods, http::Method::GET)) {
    result.pRequestHandler = &it->handlers[http::MethodToIdx(http::Method::GET)];
  } else {
    result.allowedMethods = it->methods;
    if (http::IsMethodSet(it->methods, http::Method::GET)) {
      result.allowedMethods = static_cast<http::MethodBmp>(result.allowedMethods | http::Method::HEAD);
    }
  }
  return result;
}

}  // namespace psdconv
