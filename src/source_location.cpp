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


#include "tinysexpr/source_location.hpp"
#include "tinysexpr/utf8.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>


static std::string_view
_safe_substr(std::string_view str, size_t start, size_t end)
{
  start = std::min(start, str.size());
  end = std::clamp(end, start, str.size());
  return str.substr(start, end - start);
}


std::string
tsx::display_location(std::string_view source, const span &location,
                      size_t context_lines, std::string_view hlstyle,
                      std::string_view ctxstyle)
{
  static const std::string_view endstyle = "\e[0m";

  // In-memory sources can't be re-read
  if (source.empty() or source[0] == '<')
    return std::format("in {}: {}:{} to {}:{}", source, location.start.row,
                       location.start.column, location.end.row,
                       location.end.column);

  std::ifstream file {std::string {source}, std::ios_base::binary};
  if (not file.is_open())
    return std::format("Could not open file: {}", source);

  const std::string content {std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>()};
  file.close();

  // Split content into lines
  std::vector<std::string_view> lines;
  size_t linestart = 0;
  for (size_t i = 0; i < content.size(); ++i)
  {
    if (content[i] == '\n')
    {
      lines.push_back(std::string_view {content}.substr(linestart, i - linestart));
      linestart = i + 1;
    }
  }
  lines.push_back(std::string_view {content}.substr(linestart));

  const size_t start_line = location.start.row - 1;
  const size_t end_line = location.end.row - 1;
  if (location.start.row == 0 or start_line >= lines.size() or
      end_line < start_line)
    return std::format("<invalid location in {}>", source);

  // Expand line range with context lines
  const size_t display_start =
      start_line > context_lines ? start_line - context_lines : 0;
  const size_t display_end =
      std::min(end_line + context_lines, lines.size() - 1);

  std::ostringstream output;
  output << std::format("in {}:{}:{} to {}:{}\n", source, location.start.row,
                        location.start.column, location.end.row,
                        location.end.column);

  for (size_t i = display_start; i <= display_end; ++i)
  {
    std::string_view line = lines[i];
    if (not line.empty() and line.back() == '\r')
      line.remove_suffix(1); // CRLF line endings

    output << std::format("{:4d} | ", i + 1) << ctxstyle;

    if (i >= start_line and i <= end_line)
    {
      // Highlighted columns of this line, in bytes; end column is inclusive
      const size_t hlbegin =
          i == start_line ? utf8_offset(line, location.start.column - 1) : 0;
      const size_t hlend =
          i == end_line ? utf8_offset(line, location.end.column) : line.size();

      output << _safe_substr(line, 0, hlbegin);
      output << endstyle << hlstyle;
      output << _safe_substr(line, hlbegin, hlend);
      output << endstyle << ctxstyle;
      output << _safe_substr(line, hlend, line.size());
    }
    else
      output << line;

    output << endstyle << "\n";
  }

  return output.str();
}
