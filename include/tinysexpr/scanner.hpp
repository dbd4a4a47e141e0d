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

#include "tinysexpr/cursor.hpp"
#include "tinysexpr/reader_config.hpp"
#include "tinysexpr/source_location.hpp"

#include <optional>
#include <string>

/**
 * \file scanner.hpp
 * Lexical layer of the reader
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * Text of a single atom together with its location
 *
 * \ingroup lisp
 */
struct lexeme {
  std::string text;
  span location;
};


/**
 * Character-level scanner: trivia, delimited atoms and bare atoms
 *
 * \ingroup lisp
 */
class scanner {
  public:
  /**
   * \throws tsx::config_error if \p config fails validation
   */
  scanner(cursor &cursor, reader_config config);

  /**
   * Skip whitespace and comments
   *
   * A comment runs from the comment character up to, not including, the
   * next newline.
   *
   * \return First character that is not trivia, or an empty optional at the
   *         end of input
   */
  std::optional<char32_t>
  skip_trivia();

  /**
   * Read an atom enclosed in the delimiter under the cursor
   *
   * The returned text includes both delimiter characters; escape sequences
   * are replaced according to the delimiter's rules.
   *
   * \throws tsx::invalid_escape for an escape with no replacement
   * \throws tsx::unexpected_eof if input ends before the closing delimiter
   */
  lexeme
  read_delimited();

  /**
   * Read an atom running up to whitespace or a reserved character
   *
   * The terminating character is left under the cursor.
   */
  lexeme
  read_bare_atom();

  [[nodiscard]] const reader_config&
  config() const noexcept
  { return m_config; }

  cursor&
  get_cursor() noexcept
  { return m_cursor; }

  private:
  cursor &m_cursor;
  reader_config m_config;
}; // class tsx::scanner

} // namespace tsx
