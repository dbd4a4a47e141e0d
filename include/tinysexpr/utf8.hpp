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


#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>


namespace tsx {

/// Substitute for undecodable input
inline constexpr char32_t replacement_character = U'\uFFFD';

/**
 * Number of bytes in a UTF-8 sequence starting with \p first_byte
 *
 * \return 1 to 4, or 0 if \p first_byte can't start a sequence (including
 *         lead bytes past U+10FFFF)
 */
[[nodiscard]] inline size_t
utf8_sequence_length(uint8_t first_byte) noexcept
{
  if ((first_byte & 0b1000'0000) == 0)
    return 1;
  else if ((first_byte & 0b1110'0000) == 0b1100'0000)
    return 2;
  else if ((first_byte & 0b1111'0000) == 0b1110'0000)
    return 3;
  else if ((first_byte & 0b1111'1000) == 0b1111'0000 and first_byte <= 0xF4)
    return 4;
  else
    return 0;
}

[[nodiscard]] inline bool
is_utf8_continuation(uint8_t byte) noexcept
{ return (byte & 0b1100'0000) == 0b1000'0000; }

/**
 * Append UTF-8 encoding of \p c to \p out
 */
template <typename String>
void
append_utf8(String &out, char32_t c)
{
  if (c > 0x10FFFF)
    c = replacement_character;

  if (c <= 0x7F)
    out.push_back(static_cast<char>(c));
  else if (c <= 0x7FF)
  {
    out.push_back(static_cast<char>((c >> 6) | 0b1100'0000));
    out.push_back(static_cast<char>((c & 0b11'1111) | 0b1000'0000));
  }
  else if (c <= 0xFFFF)
  {
    out.push_back(static_cast<char>((c >> 12) | 0b1110'0000));
    out.push_back(static_cast<char>(((c >> 6) & 0b11'1111) | 0b1000'0000));
    out.push_back(static_cast<char>((c & 0b11'1111) | 0b1000'0000));
  }
  else
  {
    out.push_back(static_cast<char>((c >> 18) | 0b1111'0000));
    out.push_back(static_cast<char>(((c >> 12) & 0b11'1111) | 0b1000'0000));
    out.push_back(static_cast<char>(((c >> 6) & 0b11'1111) | 0b1000'0000));
    out.push_back(static_cast<char>((c & 0b11'1111) | 0b1000'0000));
  }
}

[[nodiscard]] std::string
to_utf8(char32_t c);

/**
 * Byte offset of the \p n-th code point (0-based) of \p text
 *
 * Returns the size of \p text if it has fewer code points.
 */
[[nodiscard]] size_t
utf8_offset(std::string_view text, size_t n) noexcept;

/**
 * Render a character for a diagnostic message
 *
 * Control characters are shown as escape sequences, everything else as its
 * UTF-8 encoding.
 */
[[nodiscard]] std::string
describe_character(char32_t c);

/**
 * Whitespace test covering ASCII and the Unicode space separators
 */
[[nodiscard]] bool
is_whitespace(char32_t c) noexcept;

} // namespace tsx
