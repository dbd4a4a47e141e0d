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

#include "tinysexpr/form.hpp"
#include "tinysexpr/form_printer.hpp"
#include "tinysexpr/source_location.hpp"

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * std::format support for coordinates, spans and forms
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for tsx::coordinate, written as `row:column`
 *
 * \ingroup utils
 */
template <>
struct formatter<tsx::coordinate, char> {
  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for tsx::coordinate"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(const tsx::coordinate &x, FmtContext &ctx) const
  { return std::format_to(ctx.out(), "{}:{}", x.row, x.column); }
};


/**
 * Formatter for tsx::span, written as `row:column-row:column`
 *
 * \ingroup utils
 */
template <>
struct formatter<tsx::span, char> {
  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for tsx::span"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(const tsx::span &x, FmtContext &ctx) const
  {
    return std::format_to(ctx.out(), "{}:{}-{}:{}", x.start.row, x.start.column,
                          x.end.row, x.end.column);
  }
};


/**
 * Formatter for tsx::basic_form
 *
 * Format flags:
 * - `c`: colorize brackets by depth
 * - `#N`: print at most N levels of nesting
 *
 * \ingroup utils
 */
template <typename Value>
struct formatter<tsx::basic_form<Value>, char> {
  int maxdepth = -1;
  bool colored = false;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == 'c')
    {
      colored = true;
      it++;
    }

    if (it != ctx.end() and *it == '#')
    {
      it++;
      maxdepth = 0;
      while (it != ctx.end() and *it >= '0' and *it <= '9')
      {
        maxdepth *= 10;
        maxdepth += *it - '0';
        it += 1;
      }
    }

    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for tsx::basic_form"};

    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(const tsx::basic_form<Value> &x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    const tsx::form_printer &p = colored ? tsx::colorized_printer : tsx::raw_printer;
    p.print(buffer, x, maxdepth);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};

} // namespace std
