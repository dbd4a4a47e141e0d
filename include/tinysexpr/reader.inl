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
 * \file reader.inl
 * Template implementation of tinysexpr/reader.hpp members
 */
#pragma once

#include "tinysexpr/reader.hpp"
#include "tinysexpr/exceptions.hpp"
#include "tinysexpr/format.hpp"
#include "tinysexpr/logging.hpp"

#include <stdexcept>
#include <utility>


template <typename Value>
tsx::basic_reader<Value>::basic_reader(char_source &source,
                                       reader_config config,
                                       handler_type handler)
: m_cursor {source},
  m_scanner {m_cursor, std::move(config)},
  m_handler {std::move(handler)},
  m_state {state::reading},
  m_count {0}
{ }


template <typename Value>
const typename tsx::basic_reader<Value>::form_type*
tsx::basic_reader<Value>::next()
{
  switch (m_state)
  {
    case state::exhausted:
      return nullptr;

    case state::failed:
      throw std::logic_error {
          "reader is unusable after a syntax error in " + source_name()};

    case state::reading:
      break;
  }

  try
  {
    const form_type *result = _read_form();
    if (result == nullptr)
    {
      m_state = state::exhausted;
      debug("{}: end of input after {} forms", source_name(), m_count);
    }
    return result;
  }
  catch (...)
  {
    // Syntax errors and failures of the atom handler alike leave the cursor
    // inside a form
    m_state = state::failed;
    throw;
  }
}


template <typename Value>
const typename tsx::basic_reader<Value>::form_type*
tsx::basic_reader<Value>::read_one()
{
  const form_type *result = next();
  if (result == nullptr)
  {
    m_state = state::failed;
    throw unexpected_eof {m_cursor.location(), source_name()};
  }
  return result;
}


template <typename Value>
typename tsx::basic_reader<Value>::iterator
tsx::basic_reader<Value>::begin()
{ return iterator {*this}; }


template <typename Value>
const typename tsx::basic_reader<Value>::form_type*
tsx::basic_reader<Value>::_read_form()
{
  const std::optional<char32_t> c = m_scanner.skip_trivia();
  if (not c)
    return nullptr;

  if (*c != U'(')
    throw unexpected_char {U'(', *c, m_cursor.location(), source_name()};

  m_cursor.advance();
  const form_type *result = parse_list<Value>(m_scanner, m_handler);
  m_count += 1;
  debug("{}: form #{} at {} with {} elements", source_name(), m_count,
        result->location(), result->size());
  return result;
}
