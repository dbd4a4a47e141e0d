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


#include "tinysexpr/reader.hpp"

#include <string>
#include <utility>


tsx::stl::vector<const tsx::form*>
tsx::read_all(std::string_view text, reader_config config)
{
  string_source source {std::string {text}};
  reader forms {source, std::move(config)};

  stl::vector<const form*> result;
  for (const form *x : forms)
    result.push_back(x);
  return result;
}
