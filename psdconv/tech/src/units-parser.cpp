#include "psdconv/units-parser.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include "psdconv/stringconv.hpp"

namespace psdconv {

namespace {

struct ByteUnit {
  std::string_view suffix;
  int64_t multiplier;
};

constexpr int64_t kKi = 1024;
constexpr int64_t kK = 1000;

// Binary units first so that "Mi" is not read as "M" followed by garbage.
constexpr ByteUnit kByteUnits[] = {
    {"Ti", kKi * kKi * kKi * kKi}, {"Gi", kKi * kKi * kKi}, {"Mi", kKi * kKi}, {"Ki", kKi}, {"ki", kKi},
    {"T", kK * kK * kK * kK},      {"G", kK * kK * kK},     {"M", kK * kK},    {"K", kK},   {"k", kK}};

// Consumes the unit at the beginning of 'str' (if any) and returns its multiplier.
int64_t ConsumeUnit(std::string_view& str) {
  if (str.empty() || (str.front() >= '0' && str.front() <= '9')) {
    return 1;
  }
  for (const ByteUnit& unit : kByteUnits) {
    if (str.starts_with(unit.suffix)) {
      str.remove_prefix(unit.suffix.size());
      return unit.multiplier;
    }
  }
  throw std::invalid_argument("Invalid unit '" + std::string(str) + "' in number of bytes");
}

}  // namespace

int64_t ParseNumberOfBytes(std::string_view sizeStr) {
  if (sizeStr.empty()) {
    throw std::invalid_argument("Empty number of bytes");
  }
  int64_t totalNbBytes = 0;
  while (!sizeStr.empty()) {
    const auto nbDigits = sizeStr.find_first_not_of("0123456789");
    if (nbDigits == 0) {
      throw std::invalid_argument("Number of bytes should start with a digit");
    }
    const auto nbBytes = StringToIntegral<int64_t>(sizeStr.substr(0, nbDigits));
    sizeStr.remove_prefix(nbDigits == std::string_view::npos ? sizeStr.size() : nbDigits);

    const int64_t multiplier = ConsumeUnit(sizeStr);
    if (nbBytes > (std::numeric_limits<int64_t>::max() - totalNbBytes) / multiplier) {
      throw std::invalid_argument("Number of bytes overflow");
    }
    totalNbBytes += nbBytes * multiplier;
  }
  return totalNbBytes;
}

}  // namespace psdconv
