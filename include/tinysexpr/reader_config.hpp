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

#include <map>
#include <optional>
#include <string>

/**
 * \file reader_config.hpp
 * Lexical configuration of the reader
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * Rules for one kind of delimiter-quoted atom
 *
 * Without an escape character, the atom runs verbatim up to the next
 * occurrence of the delimiter.
 *
 * \ingroup lisp
 */
struct delimiter {
  std::optional<char32_t> escape;
  std::map<char32_t, std::string> replacements; ///< trigger -> replacement
};


/**
 * Characters with a special meaning to the reader
 *
 * The default configuration reads `"` strings with `\n \t \r \\ \"` escapes,
 * `|` symbols without escapes, and `;` comments.
 *
 * \ingroup lisp
 */
struct reader_config {
  reader_config();

  std::map<char32_t, delimiter> delimiters;
  char32_t comment;

  /**
   * Check that the configuration is unambiguous
   *
   * \throws tsx::config_error if the comment character is also a
   *         delimiter, if a bracket or whitespace is used as a delimiter or
   *         comment character, or if a delimiter is its own escape character
   */
  void
  validate() const;

  /// Whether \p c terminates a bare atom
  [[nodiscard]] bool
  is_reserved(char32_t c) const noexcept
  { return c == U'(' or c == U')' or c == comment or delimiters.contains(c); }

  /// Rules for delimiter \p c, or nullptr if \p c is not a delimiter
  [[nodiscard]] const delimiter*
  find_delimiter(char32_t c) const noexcept
  {
    const auto it = delimiters.find(c);
    return it == delimiters.end() ? nullptr : &it->second;
  }
}; // struct tsx::reader_config


/**
 * Configuration with `"` and `|` delimiters and `;` comments
 *
 * \ingroup lisp
 */
[[nodiscard]] inline reader_config
default_config()
{ return reader_config {}; }

} // namespace tsx
