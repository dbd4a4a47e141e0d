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


/**
 * \file form_parser.inl
 * Template implementation of tinysexpr/form_parser.hpp
 */
#pragma once

#include "tinysexpr/form_parser.hpp"
#include "tinysexpr/exceptions.hpp"
#include "tinysexpr/memory.hpp"

#include <utility>


template <typename Value>
const tsx::basic_form<Value>*
tsx::parse_list(scanner &scan, const atom_handler<Value> &handler)
{
  using form_type = basic_form<Value>;
  using element = typename form_type::element;

  struct frame {
    coordinate open;
    typename form_type::element_vector elements;
  };

  cursor &cur = scan.get_cursor();
  stl::vector<frame> frames;
  frames.push_back({cur.previous(), {}});

  while (true)
  {
    const std::optional<char32_t> c = scan.skip_trivia();
    if (not c)
      throw unexpected_eof {cur.location(), cur.source_name()};

    if (*c == U'(')
    {
      cur.advance();
      frames.push_back({cur.previous(), {}});
    }
    else if (*c == U')')
    {
      cur.advance();
      frame top = std::move(frames.back());
      frames.pop_back();

      const form_type *list =
          make<form_type>(std::move(top.elements), span {top.open, cur.previous()});
      if (frames.empty())
        return list;
      frames.back().elements.push_back(element {std::in_place_index<1>, list});
    }
    else
    {
      const lexeme atom = scan.config().find_delimiter(*c)
                              ? scan.read_delimited()
                              : scan.read_bare_atom();
      frames.back().elements.push_back(
          element {std::in_place_index<0>, handler(atom.text, atom.location)});
    }
  }
}
