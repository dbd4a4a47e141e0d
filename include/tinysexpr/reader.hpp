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
#include "tinysexpr/cursor.hpp"
#include "tinysexpr/form.hpp"
#include "tinysexpr/form_parser.hpp"
#include "tinysexpr/reader_config.hpp"
#include "tinysexpr/scanner.hpp"
#include "tinysexpr/stl/vector.hpp"

#include <cstddef>
#include <iterator>
#include <string_view>

/**
 * \file reader.hpp
 * Lazy reader of top-level forms
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * Pull-based reader yielding one top-level form per request
 *
 * Only the characters of the requested form (plus one character of
 * lookahead) are taken from the source; the next form is not looked at
 * until it is asked for. The end of input between forms terminates the
 * sequence normally.
 *
 * A syntax error, or an exception thrown by the atom handler, leaves the
 * reader failed: any further read throws std::logic_error. To carry on,
 * construct a new reader over a new source.
 *
 * Usage:
 * \code
 * tsx::string_source source {"(1 2) (3 (4 5))"};
 * tsx::reader reader {source};
 * for (const tsx::form *form : reader)
 *   std::cout << *form << std::endl;
 * \endcode
 *
 * \tparam Value Type produced by the atom handler; stored in forms, so it
 *         must meet the requirements of tsx::basic_form
 *
 * \ingroup lisp
 */
template <typename Value>
class basic_reader {
  public:
  using form_type = basic_form<Value>;
  using handler_type = atom_handler<Value>;

  class iterator;

  /**
   * \param source Input; owned by the caller, must outlive the reader
   * \param config Lexical configuration
   * \param handler Conversion applied to every atom
   * \throws tsx::config_error if \p config is inconsistent
   */
  explicit basic_reader(char_source &source, reader_config config = {},
                        handler_type handler = identity_atom_handler<Value> {});

  basic_reader(const basic_reader&) = delete;
  basic_reader& operator = (const basic_reader&) = delete;

  /**
   * Read the next top-level form
   *
   * \return The form, or nullptr once the input is exhausted
   * \throws tsx::unexpected_char if something other than `(` starts a form
   * \throws tsx::syntax_error for malformed forms
   */
  const form_type*
  next();

  /**
   * Read exactly one top-level form
   *
   * \throws tsx::unexpected_eof if the input ends before a form starts
   */
  const form_type*
  read_one();

  /**
   * Read the next top-level form into \p result
   *
   * \return False once the input is exhausted
   */
  bool
  operator >> (const form_type *&result)
  { return (result = next()) != nullptr; }

  iterator
  begin();

  std::default_sentinel_t
  end() const noexcept
  { return std::default_sentinel; }

  /// Number of forms yielded so far
  [[nodiscard]] size_t
  count() const noexcept
  { return m_count; }

  [[nodiscard]] const reader_config&
  config() const noexcept
  { return m_scanner.config(); }

  [[nodiscard]] const std::string&
  source_name() const noexcept
  { return m_cursor.source_name(); }

  private:
  enum class state { reading, exhausted, failed };

  const form_type*
  _read_form();

  cursor m_cursor;
  scanner m_scanner;
  handler_type m_handler;
  state m_state;
  size_t m_count;
}; // class tsx::basic_reader


/**
 * Single-pass input iterator over the forms of a tsx::basic_reader
 *
 * \ingroup lisp
 */
template <typename Value>
class basic_reader<Value>::iterator {
  public:
  using iterator_category = std::input_iterator_tag;
  using value_type = const form_type*;
  using difference_type = ptrdiff_t;
  using pointer = const value_type*;
  using reference = const value_type&;

  iterator() = default;

  explicit iterator(basic_reader &reader)
  : m_reader {&reader}, m_form {reader.next()}
  { }

  reference
  operator * () const noexcept
  { return m_form; }

  iterator&
  operator ++ ()
  {
    m_form = m_reader->next();
    return *this;
  }

  void
  operator ++ (int)
  { ++*this; }

  friend bool
  operator == (const iterator &it, std::default_sentinel_t) noexcept
  { return it.m_form == nullptr; }

  private:
  basic_reader *m_reader = nullptr;
  const form_type *m_form = nullptr;
}; // class tsx::basic_reader::iterator


/// Reader keeping atoms as their text
using reader = basic_reader<stl::string>;


/**
 * Read every form of \p text with the default configuration
 *
 * \throws tsx::syntax_error on malformed input
 *
 * \ingroup lisp
 */
stl::vector<const form*>
read_all(std::string_view text, reader_config config = {});

} // namespace tsx


#include "tinysexpr/reader.inl"
