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

#include "tinysexpr/char_source.hpp"
#include "tinysexpr/source_location.hpp"

#include <optional>
#include <string>


namespace tsx {

/**
 * Single-character lookahead over a tsx::char_source
 *
 * The cursor always knows two coordinates: the one of the character under
 * it, and the one of the character consumed last. The latter is what span
 * ends and most diagnostics refer to.
 *
 * Nothing is pulled from the source until the current character is first
 * asked for.
 *
 * \ingroup lisp
 */
class cursor {
  public:
  explicit cursor(char_source &source): m_source {source} { }

  cursor(const cursor&) = delete;
  cursor& operator = (const cursor&) = delete;

  /// Character under the cursor, or an empty optional at the end of input
  [[nodiscard]] std::optional<char32_t>
  current();

  /**
   * Consume the current character and move to the next one
   *
   * Does nothing at the end of input.
   *
   * \return The new current character
   */
  std::optional<char32_t>
  advance();

  [[nodiscard]] bool
  at_end()
  { return not current().has_value(); }

  /// Coordinate of the current character (or of the end of input)
  [[nodiscard]] const coordinate&
  location() const noexcept
  { return m_location; }

  /// Coordinate of the character consumed by the last advance()
  [[nodiscard]] const coordinate&
  previous() const noexcept
  { return m_previous; }

  [[nodiscard]] const std::string&
  source_name() const noexcept
  { return m_source.name(); }

  private:
  char_source &m_source;
  std::optional<char32_t> m_current;
  bool m_primed = false;
  coordinate m_location;
  coordinate m_previous;
}; // class tsx::cursor

} // namespace tsx
