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
#include "tinysexpr/stl/string.hpp"
#include "tinysexpr/stl/vector.hpp"

#include <cstddef>
#include <utility>
#include <variant>

/**
 * \file form.hpp
 * Parsed S-expression trees
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * A parenthesized list of atoms and nested forms
 *
 * Forms are immutable and live in collector-managed memory (see
 * memory.hpp); they are referred to by `const basic_form*` handles.
 *
 * Destructors of forms, and so of their atom values, are never run. A
 * `Value` must therefore not own memory outside the collector: use trivially
 * destructible types, or containers with tsx::gc_allocator such as
 * tsx::stl::string, instead of std::string or std::vector. Pointers held by
 * a `Value` are only seen by the collector if they live in such storage.
 *
 * \tparam Value Type produced by the atom handler for each atom
 *
 * \ingroup lisp
 */
template <typename Value>
class basic_form {
  public:
  using value_type = Value;
  using element = std::variant<Value, const basic_form*>;
  using element_vector = stl::vector<element>;
  using const_iterator = typename element_vector::const_iterator;

  basic_form(element_vector elements, const span &location)
  : m_elements {std::move(elements)}, m_location {location}
  { }

  basic_form(const basic_form&) = delete;
  basic_form& operator = (const basic_form&) = delete;

  /// From the opening to the closing bracket, both inclusive
  [[nodiscard]] const span&
  location() const noexcept
  { return m_location; }

  [[nodiscard]] size_t
  size() const noexcept
  { return m_elements.size(); }

  [[nodiscard]] bool
  empty() const noexcept
  { return m_elements.empty(); }

  [[nodiscard]] const element&
  operator [] (size_t i) const
  { return m_elements[i]; }

  [[nodiscard]] const element&
  at(size_t i) const
  { return m_elements.at(i); }

  const_iterator
  begin() const noexcept
  { return m_elements.begin(); }

  const_iterator
  end() const noexcept
  { return m_elements.end(); }

  private:
  element_vector m_elements;
  span m_location;
}; // class tsx::basic_form


/// Form with atoms kept as their text
using form = basic_form<stl::string>;


template <typename Value>
[[nodiscard]] inline bool
is_atom(const std::variant<Value, const basic_form<Value>*> &x) noexcept
{ return x.index() == 0; }

template <typename Value>
[[nodiscard]] inline bool
is_form(const std::variant<Value, const basic_form<Value>*> &x) noexcept
{ return x.index() == 1; }

/**
 * Atom value of an element
 *
 * \throws std::bad_variant_access if \p x is a nested form
 */
template <typename Value>
[[nodiscard]] inline const Value&
atom_of(const std::variant<Value, const basic_form<Value>*> &x)
{ return std::get<0>(x); }

/**
 * Nested form of an element
 *
 * \throws std::bad_variant_access if \p x is an atom
 */
template <typename Value>
[[nodiscard]] inline const basic_form<Value>&
form_of(const std::variant<Value, const basic_form<Value>*> &x)
{ return *std::get<1>(x); }

} // namespace tsx
