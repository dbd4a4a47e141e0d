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

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

/**
 * \file char_source.hpp
 * Character sources consumed by the reader
 *
 * A source hands out one Unicode code point at a time. Running out of data
 * and failure of the underlying device look the same to the reader: the
 * source simply stops producing characters.
 *
 * \ingroup lisp
 */


namespace tsx {

/**
 * Pull-based supplier of code points
 *
 * \ingroup lisp
 */
class char_source {
  public:
  explicit char_source(std::string name): m_name {std::move(name)} { }

  virtual
  ~char_source() = default;

  /**
   * Take the next character
   *
   * \return The character, or an empty optional once the source is exhausted
   */
  [[nodiscard]] virtual std::optional<char32_t>
  read() = 0;

  /// Name used in diagnostics (file path, "<string>", "<stdin>", ...)
  const std::string&
  name() const noexcept
  { return m_name; }

  private:
  std::string m_name;
}; // class tsx::char_source


/**
 * Base for sources decoding UTF-8 from a byte supply
 *
 * Bytes that can't start or continue a sequence decode to
 * tsx::replacement_character; a sequence cut short by the end of the data
 * ends the stream.
 *
 * \ingroup lisp
 */
class utf8_source: public char_source {
  public:
  using char_source::char_source;

  [[nodiscard]] std::optional<char32_t>
  read() final;

  protected:
  /// Next raw byte, or an empty optional at the end of data
  [[nodiscard]] virtual std::optional<uint8_t>
  read_byte() = 0;

  private:
  std::optional<uint8_t>
  _take_byte();

  // Byte read ahead while decoding a malformed sequence
  std::optional<uint8_t> m_pending;
}; // class tsx::utf8_source


/**
 * Characters from a std::istream
 *
 * The stream is owned by the caller and must outlive the source.
 *
 * \ingroup lisp
 */
class stream_source: public utf8_source {
  public:
  explicit stream_source(std::istream &stream, std::string name = "<stream>")
  : utf8_source(std::move(name)), m_stream {stream}
  { }

  protected:
  std::optional<uint8_t>
  read_byte() override;

  private:
  std::istream &m_stream;
}; // class tsx::stream_source


/**
 * Characters from an in-memory string
 *
 * \ingroup lisp
 */
class string_source: public utf8_source {
  public:
  explicit string_source(std::string text, std::string name = "<string>")
  : utf8_source(std::move(name)), m_text {std::move(text)}, m_pos {0}
  { }

  protected:
  std::optional<uint8_t>
  read_byte() override;

  private:
  std::string m_text;
  size_t m_pos;
}; // class tsx::string_source


/**
 * Characters from text delivered in chunks on demand
 *
 * The supplier is asked for a new chunk only when the previous one has been
 * used up, so input is requested as late as possible. This is what makes an
 * interactive session print a form as soon as its closing bracket is typed.
 *
 * \ingroup lisp
 */
class chunk_source: public utf8_source {
  public:
  /// Store the next chunk into the argument; return false at the end
  using supplier = std::function<bool(std::string &)>;

  explicit chunk_source(supplier supply, std::string name = "<chunks>")
  : utf8_source(std::move(name)), m_supply {std::move(supply)}, m_pos {0}
  { }

  protected:
  std::optional<uint8_t>
  read_byte() override;

  private:
  supplier m_supply;
  std::string m_chunk;
  size_t m_pos;
  bool m_done = false;
}; // class tsx::chunk_source

} // namespace tsx
