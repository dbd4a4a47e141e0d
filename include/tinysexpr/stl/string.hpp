#pragma once

#include "tinysexpr/memory.hpp"

#include <string>


namespace tsx::stl {

using string = std::basic_string<char, std::char_traits<char>, gc_allocator<char>>;

} // namespace tsx::stl
