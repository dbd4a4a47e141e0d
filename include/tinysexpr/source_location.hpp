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
#include <ostream>
#include <string>
#include <string_view>

/**
 * \file source_location.hpp
 * Source coordinates of parsed atoms and forms
 *
 * \ingroup lisp
 */

namespace tsx {

/**
 * Position of a single character in the input
 *
 * Both components are 1-indexed. Columns count Unicode code points.
 *
 * \ingroup lisp
 */
struct coordinate {
  size_t row = 1;
  size_t column = 1;

  /**
   * Coordinate of the character following \p c
   */
  [[nodiscard]] coordinate
  after(char32_t c) const noexcept
  {
    if (c == U'\n')
      return {row + 1, 1};
    return {row, column + 1};
  }

  bool
  operator == (const coordinate &other) const noexcept = default;
};

/**
 * Region of the input occupied by an atom or a form
 *
 * Both ends are inclusive: \ref start is the coordinate of the first
 * character (an opening bracket or delimiter), \ref end is the coordinate of
 * the last one (the closing bracket or delimiter).
 *
 * \ingroup lisp
 */
struct span {
  coordinate start;
  coordinate end;

  bool
  operator == (const span &other) const noexcept = default;
};

inline std::ostream&
operator << (std::ostream &os, const coordinate &c)
{ return os << c.row << ':' << c.column; }

inline std::ostream&
operator << (std::ostream &os, const span &s)
{ return os << s.start << '-' << s.end; }

/**
 * Display a fragment of a file around a span, with the span highlighted
 *
 * Sources whose name starts with '<' (in-memory strings, streams) have no
 * file behind them; for those only the coordinates are printed.
 *
 * \param source Source name (file path or "<string>")
 * \param location Region to highlight
 * \param context_lines Number of lines to show before and after the region
 * \param hlstyle Escape sequence starting the highlighting
 * \param ctxstyle Escape sequence used for the surrounding text
 * \return Formatted fragment
 */
[[nodiscard]] std::string
display_location(std::string_view source, const span &location,
                 size_t context_lines = 2,
                 std::string_view hlstyle = "\e[38;5;1;1m",
                 std::string_view ctxstyle = "");

} // namespace tsx
