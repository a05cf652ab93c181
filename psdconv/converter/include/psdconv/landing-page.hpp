#pragma once

#include <string>

#include "psdconv/converter-config.hpp"

namespace psdconv {

// HTML upload form showing the active limits.
std::string RenderLandingPage(const ConverterConfig& config);

}  // namespace psdconv
