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

#include <ostream>
#include <string_view>
#include <vector>

/**
 * \file form_printer.hpp
 * Debug printing of forms
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * Writes forms back as parenthesized text
 *
 * Atoms are written with `operator <<` of their value type; atoms of types
 * without one are written as `#<atom>`. No quoting or escaping is applied,
 * so for text atoms the output shows delimited atoms exactly as they were
 * decoded.
 *
 * \ingroup lisp
 */
class form_printer {
  public:
  struct color_palette {
    std::vector<std::string_view> bracket_colors; ///< cycled by depth
    std::string_view atom_color;
    std::string_view ellipsis_color;
  };

  static const color_palette default_palette;

  /// Printer without colors
  form_printer() = default;

  explicit form_printer(const color_palette &palette)
  : m_palette {palette}
  { }

  /**
   * Write \p x to \p os
   *
   * \param maxdepth Lists nested deeper than this are written as `(...)`;
   *                 negative means unlimited
   */
  template <typename Value>
  void
  print(std::ostream &os, const basic_form<Value> &x, int maxdepth = -1) const
  { _print(os, x, maxdepth); }

  private:
  template <typename Value>
  void
  _print(std::ostream &os, const basic_form<Value> &x, int maxdepth) const;

  std::string_view
  _bracket_color(int depth) const noexcept
  {
    if (m_palette.bracket_colors.empty())
      return "";
    return m_palette.bracket_colors[depth % m_palette.bracket_colors.size()];
  }

  color_palette m_palette {};
}; // class tsx::form_printer


extern const form_printer raw_printer;
extern const form_printer colorized_printer;


template <typename Value>
void
form_printer::_print(std::ostream &os, const basic_form<Value> &x,
                     int maxdepth) const
{
  using form_type = basic_form<Value>;

  // Lists still being written, innermost last
  struct frame {
    const form_type *list;
    typename form_type::const_iterator next;
    int depth;
  };
  std::vector<frame> open;

  const std::string_view acolor = m_palette.atom_color;
  const std::string_view aend = acolor.empty() ? "" : "\e[0m";
  const std::string_view ecolor = m_palette.ellipsis_color;
  const std::string_view eend = ecolor.empty() ? "" : "\e[0m";

  const auto begin_list = [&](const form_type &list, int depth) {
    const std::string_view bcolor = _bracket_color(depth);
    const std::string_view bend = bcolor.empty() ? "" : "\e[0m";
    if (maxdepth >= 0 and depth >= maxdepth)
    {
      os << bcolor << '(' << bend << ecolor << "..." << eend
         << bcolor << ')' << bend;
      return;
    }
    os << bcolor << '(' << bend;
    open.push_back({&list, list.begin(), depth});
  };

  begin_list(x, 0);
  while (not open.empty())
  {
    frame &top = open.back();
    if (top.next == top.list->end())
    {
      const std::string_view bcolor = _bracket_color(top.depth);
      os << bcolor << ')' << (bcolor.empty() ? "" : "\e[0m");
      open.pop_back();
      continue;
    }

    if (top.next != top.list->begin())
      os << ' ';
    const auto &elt = *top.next++;
    const int depth = top.depth;

    // Pushing may reallocate; top is not used past this point
    if (is_form(elt))
      begin_list(form_of(elt), depth + 1);
    else if constexpr (requires (std::ostream &s, const Value &v) { s << v; })
      os << acolor << atom_of(elt) << aend;
    else
      os << acolor << "#<atom>" << aend;
  }
}


template <typename Value>
std::ostream&
operator << (std::ostream &os, const basic_form<Value> &x)
{
  raw_printer.print(os, x);
  return os;
}

} // namespace tsx
