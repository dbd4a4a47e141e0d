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


#include "tinysexpr/exceptions.hpp"
#include "tinysexpr/utf8.hpp"

#include <format>


tsx::syntax_error::syntax_error(std::string_view message,
                                const coordinate &where,
                                std::string_view source)
: runtime_error(std::format("{}:{}:{}: {}", source, where.row, where.column,
                            message)),
  m_where {where},
  m_source {source},
  m_message {message}
{ }


void
tsx::syntax_error::display(std::ostream &os) const
{
  os << what();

  // Only files can be shown with context
  if (not m_source.empty() and m_source[0] != '<')
    os << "\n" << display_location(m_source, {m_where, m_where});
}


tsx::unexpected_eof::unexpected_eof(const coordinate &where,
                                    std::string_view source)
: syntax_error("unexpected end of file", where, source)
{ }


tsx::unexpected_char::unexpected_char(char32_t expected, char32_t got,
                                      const coordinate &where,
                                      std::string_view source)
: syntax_error(std::format("expected '{}', got '{}'",
                           describe_character(expected),
                           describe_character(got)),
               where, source),
  m_expected {expected},
  m_got {got}
{ }


tsx::invalid_escape::invalid_escape(char32_t character,
                                    const coordinate &where,
                                    std::string_view source)
: syntax_error(std::format("invalid escape character '{}'",
                           describe_character(character)),
               where, source),
  m_character {character}
{ }
