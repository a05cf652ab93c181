#include "psdconv/connection-state.hpp"

#include <cstddef>

namespace psdconv {

void ConnectionState::consumeOutput(std::size_t nbBytes) noexcept {
  outOffset += nbBytes;
  if (outOffset >= outBuffer.size()) {
    outBuffer.clear();
    outOffset = 0;
  }
}

}  // namespace psdconv
