#include "tinysexpr/char_source.hpp"
#include "tinysexpr/utf8.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <sstream>
#include <string>
#include <vector>


// Drain a source into a vector of code points
static std::vector<char32_t>
read_everything(tsx::char_source &source)
{
  std::vector<char32_t> result;
  while (std::optional<char32_t> c = source.read())
    result.push_back(*c);
  return result;
}


TEST(CharSourceTest, DecodesUtf8)
{
  tsx::string_source source {"aé€😀"};
  EXPECT_EQ(read_everything(source),
            (std::vector<char32_t> {U'a', U'é', U'€', U'😀'}));
  EXPECT_FALSE(source.read().has_value());
}


TEST(CharSourceTest, InvalidLeadByte)
{
  tsx::string_source source {"a\xff" "b"};
  EXPECT_EQ(read_everything(source),
            (std::vector<char32_t> {U'a', tsx::replacement_character, U'b'}));
}


TEST(CharSourceTest, MissingContinuationByte)
{
  // The byte breaking the sequence is decoded on its own
  tsx::string_source source {"\xc3(x"};
  EXPECT_EQ(read_everything(source),
            (std::vector<char32_t> {tsx::replacement_character, U'(', U'x'}));
}


TEST(CharSourceTest, TruncatedSequenceEndsInput)
{
  tsx::string_source source {"ab\xe2\x82"};
  EXPECT_EQ(read_everything(source), (std::vector<char32_t> {U'a', U'b'}));
}


TEST(CharSourceTest, RejectsOverlongAndSurrogates)
{
  // Overlong '(' 'a' ')', a lead byte past U+10FFFF with its continuations,
  // an encoded surrogate and an encoding of U+110000
  tsx::string_source source {"\xc0\xa8\xc1\xa1\xc0\xa9"
                             "\xf5\x80\x80\x80"
                             "\xed\xa0\x80"
                             "\xf4\x90\x80\x80"
                             "x"};

  std::vector<char32_t> expected(9, tsx::replacement_character);
  expected.push_back(U'x');
  EXPECT_EQ(read_everything(source), expected);
}


TEST(CharSourceTest, AcceptsBoundaryValues)
{
  tsx::string_source source {"\xc2\x80\xe0\xa0\x80\xf0\x90\x80\x80"
                             "\xef\xbf\xbf\xf4\x8f\xbf\xbf"};
  EXPECT_EQ(read_everything(source),
            (std::vector<char32_t> {0x80, 0x800, 0x10000, 0xFFFF, 0x10FFFF}));
}


TEST(CharSourceTest, SourceNames)
{
  tsx::string_source unnamed {""};
  EXPECT_EQ(unnamed.name(), "<string>");

  tsx::string_source named {"", "input.lisp"};
  EXPECT_EQ(named.name(), "input.lisp");
}


TEST(ChunkSourceTest, SequenceSplitAcrossChunks)
{
  const std::vector<std::string> chunks = {"(\xf0\x9f", "\x98\x80", "", ")"};
  size_t next = 0;
  tsx::chunk_source source {[&](std::string &chunk) {
    if (next == chunks.size())
      return false;
    chunk = chunks[next++];
    return true;
  }};

  EXPECT_EQ(read_everything(source), (std::vector<char32_t> {U'(', U'😀', U')'}));
}


TEST(ChunkSourceTest, SupplierIsNotCalledAfterEnd)
{
  size_t calls = 0;
  tsx::chunk_source source {[&](std::string &chunk) {
    calls += 1;
    if (calls > 1)
      return false;
    chunk = "x";
    return true;
  }};

  EXPECT_EQ(calls, 0);
  EXPECT_EQ(source.read(), U'x');
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(source.read().has_value());
  EXPECT_FALSE(source.read().has_value());
  EXPECT_EQ(calls, 2);
}


TEST(StreamSourceTest, ReadsStream)
{
  std::istringstream input {"(a\n b)"};
  tsx::stream_source source {input, "<test>"};

  EXPECT_EQ(source.name(), "<test>");
  EXPECT_EQ(read_everything(source),
            (std::vector<char32_t> {U'(', U'a', U'\n', U' ', U'b', U')'}));
}

