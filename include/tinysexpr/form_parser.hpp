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
#include "tinysexpr/scanner.hpp"
#include "tinysexpr/source_location.hpp"

#include <concepts>
#include <functional>
#include <string_view>

/**
 * \file form_parser.hpp
 * Construction of forms from scanned atoms
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * Conversion of atom text into the value stored in a form
 *
 * Receives the decoded text (delimiters included for quoted atoms) and the
 * atom's location.
 *
 * \ingroup lisp
 */
template <typename Value>
using atom_handler = std::function<Value(std::string_view text, const span &location)>;


/**
 * Atom handler keeping the text as is
 *
 * \ingroup lisp
 */
template <typename Value>
requires std::constructible_from<Value, std::string_view>
struct identity_atom_handler {
  Value
  operator () (std::string_view text, [[maybe_unused]] const span &location) const
  { return Value(text); }
};


/**
 * Parse the rest of a list whose opening bracket was just consumed
 *
 * Nested lists are kept on an explicit stack of open frames; nesting depth
 * is limited by memory only.
 *
 * \param scan Scanner positioned right after the opening `(`
 * \param handler Conversion applied to every atom
 * \return The list, spanning from its `(` to its matching `)`
 * \throws tsx::unexpected_eof if input ends before the list is closed
 * \throws tsx::invalid_escape from tsx::scanner::read_delimited()
 *
 * \ingroup lisp
 */
template <typename Value>
const basic_form<Value>*
parse_list(scanner &scan, const atom_handler<Value> &handler);

} // namespace tsx


#include "tinysexpr/form_parser.inl"
