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


#include "tinysexpr/scanner.hpp"
#include "tinysexpr/exceptions.hpp"
#include "tinysexpr/utf8.hpp"

#include <stdexcept>
#include <utility>


tsx::scanner::scanner(cursor &cursor, reader_config config)
: m_cursor {cursor}, m_config {std::move(config)}
{ m_config.validate(); }


std::optional<char32_t>
tsx::scanner::skip_trivia()
{
  while (true)
  {
    const std::optional<char32_t> c = m_cursor.current();
    if (not c)
      return std::nullopt;

    if (is_whitespace(*c))
      m_cursor.advance();
    else if (*c == m_config.comment)
    {
      // Newline is left for the whitespace branch
      std::optional<char32_t> cc = m_cursor.advance();
      while (cc and *cc != U'\n')
        cc = m_cursor.advance();
    }
    else
      return c;
  }
}


tsx::lexeme
tsx::scanner::read_delimited()
{
  const std::optional<char32_t> open = m_cursor.current();
  const delimiter *rules = open ? m_config.find_delimiter(*open) : nullptr;
  if (rules == nullptr)
    throw std::logic_error {"read_delimited() called off a delimiter"};

  const coordinate start = m_cursor.location();
  std::string text;
  append_utf8(text, *open);

  for (std::optional<char32_t> c = m_cursor.advance(); c; c = m_cursor.advance())
  {
    if (rules->escape and *c == *rules->escape)
    {
      const std::optional<char32_t> trigger = m_cursor.advance();
      if (not trigger)
        break;

      const auto it = rules->replacements.find(*trigger);
      if (it == rules->replacements.end())
        throw invalid_escape {*trigger, m_cursor.location(), m_cursor.source_name()};
      text += it->second;
    }
    else if (*c == *open)
    {
      append_utf8(text, *c);
      m_cursor.advance();
      return {std::move(text), {start, m_cursor.previous()}};
    }
    else
      append_utf8(text, *c);
  }

  throw unexpected_eof {m_cursor.location(), m_cursor.source_name()};
}


tsx::lexeme
tsx::scanner::read_bare_atom()
{
  const coordinate start = m_cursor.location();
  std::string text;

  std::optional<char32_t> c = m_cursor.current();
  while (c and not is_whitespace(*c) and not m_config.is_reserved(*c))
  {
    append_utf8(text, *c);
    c = m_cursor.advance();
  }

  return {std::move(text), {start, m_cursor.previous()}};
}
