#pragma once

#include <string_view>

#include "psdconv/http-response.hpp"
#include "psdconv/http-status-code.hpp"

namespace psdconv {

// Builds a response with a JSON body {"error":"<message>"}.
HttpResponse MakeJsonErrorResponse(http::StatusCode statusCode, std::string_view message);

// Builds a JSON error response whose message is the reason phrase of the status code.
HttpResponse MakeJsonErrorResponse(http::StatusCode statusCode);

}  // namespace psdconv
