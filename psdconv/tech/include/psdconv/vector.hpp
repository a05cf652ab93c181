#pragma once

#include <amc/vector.hpp>
#include <memory>

namespace psdconv {

template <class T, class Alloc = std::allocator<T>>
using vector = amc::vector<T, Alloc>;

}  // namespace psdconv
