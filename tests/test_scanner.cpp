#include "tinysexpr/scanner.hpp"
#include "tinysexpr/exceptions.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>


namespace {

// Scanner over a string with the default configuration
struct scanner_fixture {
  explicit scanner_fixture(const std::string &text,
                           tsx::reader_config config = {})
  : source {text}, cursor {source}, scanner {cursor, std::move(config)}
  { }

  tsx::string_source source;
  tsx::cursor cursor;
  tsx::scanner scanner;
};

} // anonymous namespace


TEST(ScannerTest, SkipTrivia)
{
  scanner_fixture s {"  ; comment ( ignored\n\t x"};

  EXPECT_EQ(s.scanner.skip_trivia(), U'x');
  EXPECT_EQ(s.cursor.location(), (tsx::coordinate {2, 3}));
}


TEST(ScannerTest, SkipTriviaToEnd)
{
  scanner_fixture s {"  ; nothing but a comment"};

  EXPECT_FALSE(s.scanner.skip_trivia().has_value());
  EXPECT_TRUE(s.cursor.at_end());
}


TEST(ScannerTest, UnicodeWhitespace)
{
  scanner_fixture s {"　 ab cd"};

  EXPECT_EQ(s.scanner.skip_trivia(), U'a');
  const tsx::lexeme atom = s.scanner.read_bare_atom();
  EXPECT_EQ(atom.text, "ab");
  EXPECT_EQ(atom.location, (tsx::span {{1, 3}, {1, 4}}));
}


TEST(ScannerTest, BareAtom)
{
  scanner_fixture s {"abc(d"};

  const tsx::lexeme atom = s.scanner.read_bare_atom();
  EXPECT_EQ(atom.text, "abc");
  EXPECT_EQ(atom.location, (tsx::span {{1, 1}, {1, 3}}));
  EXPECT_EQ(s.cursor.current(), U'(');
}


TEST(ScannerTest, BareAtomStopsAtReservedCharacters)
{
  for (const char *text : {"ab)", "ab;c", "ab|c|", "ab\"c\"", "ab c", "ab"})
  {
    SCOPED_TRACE(text);
    scanner_fixture s {text};
    EXPECT_EQ(s.scanner.read_bare_atom().text, "ab");
  }
}


TEST(ScannerTest, DelimitedAtom)
{
  scanner_fixture s {"|a ; (b)| rest"};

  const tsx::lexeme atom = s.scanner.read_delimited();
  EXPECT_EQ(atom.text, "|a ; (b)|");
  EXPECT_EQ(atom.location, (tsx::span {{1, 1}, {1, 9}}));
  EXPECT_EQ(s.cursor.current(), U' ');
}


TEST(ScannerTest, DelimitedAtomSpansLines)
{
  scanner_fixture s {"\"a\nb\""};

  const tsx::lexeme atom = s.scanner.read_delimited();
  EXPECT_EQ(atom.text, "\"a\nb\"");
  EXPECT_EQ(atom.location, (tsx::span {{1, 1}, {2, 2}}));
}


TEST(ScannerTest, EscapeSequences)
{
  scanner_fixture s {R"("a\nb\t\\\"c")"};

  const tsx::lexeme atom = s.scanner.read_delimited();
  EXPECT_EQ(atom.text, "\"a\nb\t\\\"c\"");
  EXPECT_EQ(atom.location, (tsx::span {{1, 1}, {1, 13}}));
}


TEST(ScannerTest, NoEscapesInPipes)
{
  scanner_fixture s {R"(|a\n|)"};
  EXPECT_EQ(s.scanner.read_delimited().text, R"(|a\n|)");
}


TEST(ScannerTest, InvalidEscape)
{
  scanner_fixture s {"\"ab\\qc\""};

  try
  {
    s.scanner.read_delimited();
    FAIL() << "expected tsx::invalid_escape";
  }
  catch (const tsx::invalid_escape &exn)
  {
    EXPECT_EQ(exn.character(), U'q');
    EXPECT_EQ(exn.where(), (tsx::coordinate {1, 5}));
    EXPECT_EQ(exn.message(), "invalid escape character 'q'");
  }
}


TEST(ScannerTest, EndOfInputInsideDelimitedAtom)
{
  scanner_fixture s {"|abc"};

  try
  {
    s.scanner.read_delimited();
    FAIL() << "expected tsx::unexpected_eof";
  }
  catch (const tsx::unexpected_eof &exn)
  { EXPECT_EQ(exn.where(), (tsx::coordinate {1, 5})); }
}


TEST(ScannerTest, EndOfInputAfterEscape)
{
  scanner_fixture s {"\"ab\\"};
  EXPECT_THROW(s.scanner.read_delimited(), tsx::unexpected_eof);
}


TEST(ScannerTest, ReadDelimitedOffDelimiter)
{
  scanner_fixture s {"abc"};
  EXPECT_THROW(s.scanner.read_delimited(), std::logic_error);
}


TEST(ScannerTest, CustomComment)
{
  tsx::reader_config config;
  config.comment = U'%';
  scanner_fixture s {"% x\n;y", config};

  EXPECT_EQ(s.scanner.skip_trivia(), U';');
  EXPECT_EQ(s.scanner.read_bare_atom().text, ";y");
}


TEST(ScannerTest, RejectsInvalidConfiguration)
{
  tsx::reader_config config;
  config.delimiters[U';'] = tsx::delimiter {};

  tsx::string_source source {""};
  tsx::cursor cursor {source};
  EXPECT_THROW((tsx::scanner {cursor, config}), tsx::config_error);
}
