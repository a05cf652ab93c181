#pragma once

#include <cstdint>
#include <string_view>

namespace psdconv {

// Parses a string representation of a number of bytes.
// Accepted forms: plain digits ("524288000") or digits followed by a unit, possibly chained ("500Mi", "1Gi512Mi").
// Units with an 'i' are powers of 1024 (Ki, Mi, Gi, Ti), units without are powers of 1000 (k, K, M, G, T).
// Throws std::invalid_argument on malformed input.
int64_t ParseNumberOfBytes(std::string_view sizeStr);

}  // namespace psdconv
