#include "psdconv/http-error-build.hpp"

#include <string_view>

#include "psdconv/http-constants.hpp"
#include "psdconv/http-response.hpp"
#include "psdconv/http-status-code.hpp"
#include "psdconv/json-serializer.hpp"

namespace psdconv {

namespace {
struct ErrorBody {
  std::string_view error;
};
}  // namespace

}  // namespace psdconv

template <>
struct glz::meta<psdconv::ErrorBody> {
  using T = psdconv::ErrorBody;
  static constexpr auto value = object("error", &T::error);
};

namespace psdconv {

HttpResponse MakeJsonErrorResponse(http::StatusCode statusCode, std::string_view message) {
  return {statusCode, SerializeToJson(ErrorBody{message}), http::ContentTypeApplicationJson};
}

HttpResponse MakeJsonErrorResponse(http::StatusCode statusCode) {
  return MakeJsonErrorResponse(statusCode, http::ReasonPhraseFor(statusCode));
}

}  // namespace psdconv
