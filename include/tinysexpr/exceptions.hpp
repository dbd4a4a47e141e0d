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

#include "tinysexpr/source_location.hpp"

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * \file exceptions.hpp
 * Errors reported by the reader
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * Malformed input
 *
 * Every syntax error is fatal to the reading session it was raised in.
 * `what()` has the form `<source>:<row>:<col>: <message>`.
 *
 * \ingroup lisp
 */
struct syntax_error: std::runtime_error {
  syntax_error(std::string_view message, const coordinate &where,
               std::string_view source = "<string>");

  /// Coordinate of the offending character (or of the end of input)
  const coordinate&
  where() const noexcept
  { return m_where; }

  /// Name of the source the error was found in
  const std::string&
  source() const noexcept
  { return m_source; }

  /// The message without the location prefix
  const std::string&
  message() const noexcept
  { return m_message; }

  /**
   * Write the error followed by the offending line(s) of the source
   *
   * \throws std::bad_alloc or std::format_error while rendering the source
   *         fragment
   */
  void
  display(std::ostream &os) const;

  std::string
  display() const
  {
    std::ostringstream buf;
    display(buf);
    return buf.str();
  }

  private:
  coordinate m_where;
  std::string m_source;
  std::string m_message;
}; // struct tsx::syntax_error


/**
 * Input ended inside an open list or delimited atom
 *
 * \ingroup lisp
 */
struct unexpected_eof: syntax_error {
  unexpected_eof(const coordinate &where, std::string_view source = "<string>");
}; // struct tsx::unexpected_eof


/**
 * A character was found where a different one was required
 *
 * \ingroup lisp
 */
struct unexpected_char: syntax_error {
  unexpected_char(char32_t expected, char32_t got, const coordinate &where,
                  std::string_view source = "<string>");

  char32_t
  expected() const noexcept
  { return m_expected; }

  char32_t
  got() const noexcept
  { return m_got; }

  private:
  char32_t m_expected;
  char32_t m_got;
}; // struct tsx::unexpected_char


/**
 * Escape character followed by a character with no configured replacement
 *
 * \ingroup lisp
 */
struct invalid_escape: syntax_error {
  invalid_escape(char32_t character, const coordinate &where,
                 std::string_view source = "<string>");

  char32_t
  character() const noexcept
  { return m_character; }

  private:
  char32_t m_character;
}; // struct tsx::invalid_escape


/**
 * Inconsistent tsx::reader_config
 *
 * \ingroup lisp
 */
struct config_error: std::runtime_error {
  using runtime_error::runtime_error;
}; // struct tsx::config_error

} // namespace tsx
