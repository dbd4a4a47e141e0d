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


#include "tinysexpr/char_source.hpp"
#include "tinysexpr/logging.hpp"
#include "tinysexpr/utf8.hpp"

#include <ios>


std::optional<uint8_t>
tsx::utf8_source::_take_byte()
{
  if (m_pending)
  {
    const uint8_t byte = *m_pending;
    m_pending.reset();
    return byte;
  }
  return read_byte();
}


std::optional<char32_t>
tsx::utf8_source::read()
{
  const std::optional<uint8_t> first = _take_byte();
  if (not first)
    return std::nullopt;

  const size_t length = utf8_sequence_length(*first);
  if (length == 0)
    return replacement_character;
  if (length == 1)
    return static_cast<char32_t>(*first);

  static const uint8_t lead_mask[] = {0, 0, 0b0001'1111, 0b0000'1111, 0b0000'0111};
  char32_t result = *first & lead_mask[length];
  for (size_t i = 1; i < length; ++i)
  {
    const std::optional<uint8_t> next = _take_byte();
    if (not next)
      return std::nullopt;

    if (not is_utf8_continuation(*next))
    {
      // Keep the byte; it may start the next character
      m_pending = next;
      return replacement_character;
    }

    result = (result << 6) | (*next & 0b0011'1111);
  }

  // Overlong forms, surrogates and values past the Unicode range
  static const char32_t min_value[] = {0, 0, 0x80, 0x800, 0x10000};
  if (result < min_value[length] or (result >= 0xD800 and result <= 0xDFFF) or
      result > 0x10FFFF)
    return replacement_character;
  return result;
}


std::optional<uint8_t>
tsx::stream_source::read_byte()
{
  try
  {
    const std::istream::int_type c = m_stream.get();
    if (c == std::istream::traits_type::eof())
      return std::nullopt;
    return static_cast<uint8_t>(c);
  }
  catch (const std::ios_base::failure &exn)
  {
    // Streams with exceptions enabled: treat failure as end of input
    warning("reading from {} failed: {}", name(), exn.what());
    return std::nullopt;
  }
}


std::optional<uint8_t>
tsx::string_source::read_byte()
{
  if (m_pos >= m_text.size())
    return std::nullopt;
  return static_cast<uint8_t>(m_text[m_pos++]);
}


std::optional<uint8_t>
tsx::chunk_source::read_byte()
{
  while (m_pos >= m_chunk.size())
  {
    if (m_done)
      return std::nullopt;

    m_chunk.clear();
    m_pos = 0;
    if (not m_supply(m_chunk))
    {
      m_done = true;
      return std::nullopt;
    }
  }
  return static_cast<uint8_t>(m_chunk[m_pos++]);
}
