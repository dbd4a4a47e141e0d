#pragma once

#include "tinysexpr/memory.hpp"

#include <vector>


namespace tsx::stl {

template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

} // namespace tsx::stl
