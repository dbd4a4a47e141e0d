/*
 * tinysexpr - Lazy S-expression reader with exact source coordinates
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include "tinysexpr/utf8.hpp"

#include <algorithm>
#include <format>


std::string
tsx::to_utf8(char32_t c)
{
  std::string result;
  result.reserve(4);
  append_utf8(result, c);
  return result;
}


size_t
tsx::utf8_offset(std::string_view text, size_t n) noexcept
{
  size_t offset = 0;
  for (; n > 0 and offset < text.size(); --n)
  {
    const size_t len = utf8_sequence_length(static_cast<uint8_t>(text[offset]));
    // Malformed bytes count as one character each
    offset += len == 0 ? 1 : len;
  }
  return std::min(offset, text.size());
}


std::string
tsx::describe_character(char32_t c)
{
  switch (c)
  {
    case U'\n': return "\\n";
    case U'\t': return "\\t";
    case U'\r': return "\\r";
    case U'\v': return "\\v";
    case U'\f': return "\\f";
    case U'\0': return "\\0";
  }

  if (c < 0x20 or c == 0x7F)
    return std::format("\\x{:02x}", static_cast<unsigned>(c));

  return to_utf8(c);
}


bool
tsx::is_whitespace(char32_t c) noexcept
{
  switch (c)
  {
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case U' ':
    // Information separators
    case 0x1C:
    case 0x1D:
    case 0x1E:
    case 0x1F:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
  }
  return c >= 0x2000 and c <= 0x200A;
}
