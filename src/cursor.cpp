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


#include "tinysexpr/cursor.hpp"


std::optional<char32_t>
tsx::cursor::current()
{
  if (not m_primed)
  {
    m_current = m_source.read();
    m_primed = true;
  }
  return m_current;
}


std::optional<char32_t>
tsx::cursor::advance()
{
  const std::optional<char32_t> consumed = current();
  if (not consumed)
    return std::nullopt;

  // Next coordinate is derived from the character being consumed
  m_previous = m_location;
  m_location = m_location.after(*consumed);
  m_current = m_source.read();
  return m_current;
}
