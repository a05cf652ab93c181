#include "psdconv/landing-page.hpp"

#include <format>
#include <string>

#include "psdconv/converter-config.hpp"

namespace psdconv {

std::string RenderLandingPage(const ConverterConfig& config) {
  std::string accept;
  for (const std::string& extension : config.allowedExtensions) {
    if (!accept.empty()) {
      accept.push_back(',');
    }
    accept.push_back('.');
    accept.append(extension);
  }

  return std::format(
      R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>PSD to PNG converter</title>
</head>
<body>
<h1>PSD to PNG converter</h1>
<p>Upload one or more PSD files: each one is flattened into a PNG image and the results are returned as a ZIP
archive.</p>
<ul>
<li>Maximum number of files: {}</li>
<li>Maximum size of a file: {}MB</li>
<li>Maximum total size: {}MB</li>
<li>Conversion timeout: {}s</li>
</ul>
<form action="/convert" method="post" enctype="multipart/form-data">
<input type="file" name="files" accept="{}" multiple required>
<button type="submit">Convert</button>
</form>
</body>
</html>
)",
      config.maxFilesCount, config.maxSingleFileBytes / kBytesPerMiB, config.maxTotalRequestBytes / kBytesPerMiB,
      config.conversionTimeout.count(), accept);
}

}  // namespace psdconv
