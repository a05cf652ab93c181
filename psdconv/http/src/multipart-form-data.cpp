#include "psdconv/multipart-form-data.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>

#include "psdconv/http-constants.hpp"
#include "psdconv/http-header.hpp"
#include "psdconv/string-equal-ignore-case.hpp"
#include "psdconv/string-trim.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {
namespace {

constexpr std::string_view kDoubleDash{"--"};
constexpr std::string_view kMiddleBoundaryPrefix{"\r\n--"};

std::string_view StripQuotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

// Splits on ';' outside of double quotes, so that filenames containing ';' are kept whole.
std::size_t FindParamSeparator(std::string_view value) {
  bool inQuotes = false;
  for (std::size_t pos = 0; pos < value.size(); ++pos) {
    const char ch = value[pos];
    if (ch == '"') {
      inQuotes = !inQuotes;
    } else if (ch == '\\' && inQuotes) {
      ++pos;
    } else if (ch == ';' && !inQuotes) {
      return pos;
    }
  }
  return std::string_view::npos;
}

struct ContentDispositionInfo {
  std::string_view name;
  std::optional<std::string_view> filename;
  std::string_view invalidReason;
};

ContentDispositionInfo ParseContentDisposition(std::string_view headerValue) {
  std::string_view remaining = TrimOws(headerValue);
  ContentDispositionInfo ret;

  if (remaining.empty()) {
    ret.invalidReason = "multipart part missing Content-Disposition value";
    return ret;
  }

  std::string_view type;
  bool nameSeen = false;
  std::optional<std::string_view> extendedFilename;

  bool firstToken = true;
  while (!remaining.empty()) {
    const auto semicolon = FindParamSeparator(remaining);
    const std::string_view token = TrimOws(remaining.substr(0, semicolon));
    if (token.empty()) {
      ret.invalidReason = "multipart part invalid Content-Disposition parameter";
      return ret;
    }

    if (firstToken) {
      type = token;
    } else {
      const auto eq = token.find('=');
      if (eq == std::string_view::npos) {
        ret.invalidReason = "multipart part invalid Content-Disposition parameter";
        return ret;
      }
      const std::string_view key = TrimOws(token.substr(0, eq));
      const std::string_view value = StripQuotes(TrimOws(token.substr(eq + 1)));
      if (CaseInsensitiveEqual(key, "name")) {
        ret.name = value;
        nameSeen = true;
      } else if (CaseInsensitiveEqual(key, "filename")) {
        ret.filename = value;
      } else if (CaseInsensitiveEqual(key, "filename*")) {
        // RFC 5987 style: charset'lang'value. The value is kept percent-encoded.
        const auto firstTick = value.find('\'');
        const auto secondTick = firstTick == std::string_view::npos ? firstTick : value.find('\'', firstTick + 1);
        if (secondTick == std::string_view::npos) {
          ret.invalidReason = "multipart part invalid Content-Disposition filename* parameter";
          return ret;
        }
        extendedFilename = value.substr(secondTick + 1);
      }
    }

    if (semicolon == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(semicolon + 1);
    firstToken = false;
  }

  if (extendedFilename && !ret.filename) {
    ret.filename = extendedFilename;
  }

  if (!CaseInsensitiveEqual(type, "form-data")) {
    ret.invalidReason = "multipart part must have Content-Disposition: form-data";
  } else if (!nameSeen) {
    ret.invalidReason = "multipart part missing name parameter";
  }
  return ret;
}

std::string_view AppendHeader(std::string_view line, const MultipartFormDataOptions& options, std::size_t headerCount,
                              vector<http::HeaderView>& headers) {
  const auto colon = line.find(':');
  if (colon == std::string_view::npos) {
    return "multipart part header missing colon";
  }
  const auto name = TrimOws(line.substr(0, colon));
  if (name.empty()) {
    return "multipart part header missing name";
  }
  if (options.maxHeadersPerPart != 0 && headerCount >= options.maxHeadersPerPart) {
    return "multipart part exceeds header limit";
  }
  headers.emplace_back(name, TrimOws(line.substr(colon + 1)));
  return {};
}

}  // namespace

std::string_view ExtractMultipartBoundary(std::string_view contentType) {
  const auto semicolon = contentType.find(';');
  if (!CaseInsensitiveEqual(TrimOws(contentType.substr(0, semicolon)), http::ContentTypeMultipartFormData) ||
      semicolon == std::string_view::npos) {
    return {};
  }

  auto params = contentType.substr(semicolon + 1);
  while (!params.empty()) {
    const auto next = params.find(';');
    const auto chunk = params.substr(0, next);
    const auto eq = chunk.find('=');
    if (eq != std::string_view::npos && CaseInsensitiveEqual(TrimOws(chunk.substr(0, eq)), "boundary")) {
      return StripQuotes(TrimOws(chunk.substr(eq + 1)));
    }
    if (next == std::string_view::npos) {
      break;
    }
    params.remove_prefix(next + 1);
  }
  return {};
}

std::string_view MultipartFormData::Part::headerValueOrEmpty(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [key](const http::HeaderView& header) { return CaseInsensitiveEqual(header.name, key); });
  return it != _headers.end() ? it->value : std::string_view{};
}

const MultipartFormData::Part* MultipartFormData::part(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_parts, [name](const Part& part) { return part.name == name; });
  return it == _parts.end() ? nullptr : &*it;
}

vector<std::reference_wrapper<const MultipartFormData::Part>> MultipartFormData::parts(std::string_view name) const {
  vector<std::reference_wrapper<const Part>> matches;
  std::ranges::copy_if(_parts, std::back_inserter(matches), [name](const Part& part) { return part.name == name; });
  return matches;
}

MultipartFormData::MultipartFormData(std::string_view contentTypeHeader, std::string_view body,
                                     MultipartFormDataOptions options) {
  parse(contentTypeHeader, body, options);

  // Header views are bound once all headers are stored, as the header vector may reallocate while parsing.
  for (Part& part : _parts) {
    part._headers = std::span<const http::HeaderView>(_headers.data() + part._headerOffset, part._headerCount);
  }
}

void MultipartFormData::parse(std::string_view contentTypeHeader, std::string_view body,
                              const MultipartFormDataOptions& options) {
  const std::string_view boundary = ExtractMultipartBoundary(contentTypeHeader);
  if (boundary.empty()) {
    _invalidReason = "multipart/form-data boundary missing";
    return;
  }

  const auto matchBoundary = [this, boundary](std::string_view& data) {
    if (!data.starts_with(kDoubleDash) || !data.substr(kDoubleDash.size()).starts_with(boundary)) {
      _invalidReason = "multipart body missing starting boundary";
      return false;
    }
    data.remove_prefix(kDoubleDash.size() + boundary.size());
    return true;
  };

  if (!matchBoundary(body)) {
    return;
  }
  if (!body.starts_with(http::CRLF)) {
    _invalidReason = "multipart boundary not followed by CRLF";
    return;
  }
  body.remove_prefix(http::CRLF.size());

  while (true) {
    if (options.maxParts != 0 && _parts.size() >= options.maxParts) {
      _invalidReason = "multipart exceeds part limit";
      return;
    }

    // Part headers end with an empty line. A part without headers starts directly with CRLF.
    std::string_view headerBlock;
    if (body.starts_with(http::CRLF)) {
      body.remove_prefix(http::CRLF.size());
    } else {
      const auto headerEnd = body.find(http::DoubleCRLF);
      if (headerEnd == std::string_view::npos) {
        _invalidReason = "multipart part missing header terminator";
        return;
      }
      headerBlock = body.substr(0, headerEnd);
      body.remove_prefix(headerEnd + http::DoubleCRLF.size());
    }

    auto& part = _parts.emplace_back();
    part._headerOffset = _headers.size();

    std::size_t headerCountForPart = 0;
    while (!headerBlock.empty()) {
      const auto lineEnd = headerBlock.find(http::CRLF);
      const std::string_view line = headerBlock.substr(0, lineEnd);
      headerBlock.remove_prefix(lineEnd == std::string_view::npos ? headerBlock.size() : lineEnd + http::CRLF.size());
      if (line.empty()) {
        continue;
      }
      _invalidReason = AppendHeader(line, options, headerCountForPart, _headers);
      if (!_invalidReason.empty()) {
        return;
      }
      ++headerCountForPart;
    }
    part._headerCount = headerCountForPart;

    const std::span<const http::HeaderView> partHeaders(_headers.data() + part._headerOffset, headerCountForPart);
    const auto contentDispositionIt = std::ranges::find_if(partHeaders, [](const http::HeaderView& header) {
      return CaseInsensitiveEqual(header.name, http::ContentDisposition);
    });
    if (contentDispositionIt == partHeaders.end()) {
      _invalidReason = "multipart part missing Content-Disposition header";
      return;
    }
    const auto cdInfo = ParseContentDisposition(contentDispositionIt->value);
    if (!cdInfo.invalidReason.empty()) {
      _invalidReason = cdInfo.invalidReason;
      return;
    }
    part.name = cdInfo.name;
    part.filename = cdInfo.filename;

    const auto contentTypeIt = std::ranges::find_if(partHeaders, [](const http::HeaderView& header) {
      return CaseInsensitiveEqual(header.name, http::ContentType);
    });
    if (contentTypeIt != partHeaders.end() && !contentTypeIt->value.empty()) {
      part.contentType = contentTypeIt->value;
    }

    // The part value ends at the first CRLF-- followed by the boundary.
    std::size_t boundaryPos = 0;
    while (true) {
      boundaryPos = body.find(kMiddleBoundaryPrefix, boundaryPos);
      if (boundaryPos == std::string_view::npos) {
        _invalidReason = "multipart part missing closing boundary";
        return;
      }
      if (body.substr(boundaryPos + kMiddleBoundaryPrefix.size()).starts_with(boundary)) {
        break;
      }
      boundaryPos += kMiddleBoundaryPrefix.size();
    }

    if (options.maxPartSizeBytes != 0 && boundaryPos > options.maxPartSizeBytes) {
      _invalidReason = "multipart part exceeds size limit";
      return;
    }
    part.value = body.substr(0, boundaryPos);
    body.remove_prefix(boundaryPos + http::CRLF.size());  // drop CRLF preceding boundary marker

    if (!matchBoundary(body)) {
      return;
    }

    const bool finalBoundary = body.starts_with(kDoubleDash);
    if (finalBoundary) {
      body.remove_prefix(kDoubleDash.size());
      // Anything after the close delimiter is an epilogue that must be ignored (RFC 2046).
      break;
    }

    if (!body.starts_with(http::CRLF)) {
      _invalidReason = "multipart boundary missing CRLF";
      return;
    }
    body.remove_prefix(http::CRLF.size());
  }
}

}  // namespace psdconv
