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


#include "tinysexpr/reader_config.hpp"
#include "tinysexpr/exceptions.hpp"
#include "tinysexpr/utf8.hpp"

#include <format>


tsx::reader_config::reader_config()
: delimiters {
    {U'"', {U'\\', {{U'n', "\n"},
                    {U't', "\t"},
                    {U'r', "\r"},
                    {U'\\', "\\"},
                    {U'"', "\""}}}},
    {U'|', {std::nullopt, {}}},
  },
  comment {U';'}
{ }


static bool
_is_bracket(char32_t c)
{ return c == U'(' or c == U')'; }


void
tsx::reader_config::validate() const
{
  if (_is_bracket(comment) or is_whitespace(comment))
    throw config_error {std::format("invalid comment character '{}'",
                                    describe_character(comment))};

  for (const auto &[c, rules] : delimiters)
  {
    if (_is_bracket(c) or is_whitespace(c))
      throw config_error {std::format("invalid delimiter character '{}'",
                                      describe_character(c))};

    if (c == comment)
      throw config_error {
          std::format("'{}' is both a delimiter and the comment character",
                      describe_character(c))};

    if (rules.escape == c)
      throw config_error {
          std::format("delimiter '{}' can't be its own escape character",
                      describe_character(c))};
  }
}
