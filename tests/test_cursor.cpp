#include "tinysexpr/cursor.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>


namespace {

// Source counting how many characters were taken from it
class counting_source: public tsx::char_source {
  public:
  explicit counting_source(std::u32string text)
  : char_source("<counting>"), m_text {std::move(text)}
  { }

  std::optional<char32_t>
  read() override
  {
    m_reads += 1;
    if (m_pos >= m_text.size())
      return std::nullopt;
    return m_text[m_pos++];
  }

  size_t
  reads() const noexcept
  { return m_reads; }

  private:
  std::u32string m_text;
  size_t m_pos = 0;
  size_t m_reads = 0;
};

} // anonymous namespace


TEST(CursorTest, StartsAtFirstCharacter)
{
  tsx::string_source source {"ab"};
  tsx::cursor cursor {source};

  EXPECT_EQ(cursor.location(), (tsx::coordinate {1, 1}));
  EXPECT_EQ(cursor.current(), U'a');
  EXPECT_FALSE(cursor.at_end());
  EXPECT_EQ(cursor.source_name(), "<string>");
}


TEST(CursorTest, TracksRowsAndColumns)
{
  tsx::string_source source {"ab\nc"};
  tsx::cursor cursor {source};

  EXPECT_EQ(cursor.advance(), U'b');
  EXPECT_EQ(cursor.location(), (tsx::coordinate {1, 2}));
  EXPECT_EQ(cursor.previous(), (tsx::coordinate {1, 1}));

  EXPECT_EQ(cursor.advance(), U'\n');
  EXPECT_EQ(cursor.location(), (tsx::coordinate {1, 3}));

  EXPECT_EQ(cursor.advance(), U'c');
  EXPECT_EQ(cursor.location(), (tsx::coordinate {2, 1}));
  EXPECT_EQ(cursor.previous(), (tsx::coordinate {1, 3}));
}


TEST(CursorTest, ColumnsCountCodePoints)
{
  tsx::string_source source {"é😀x"};
  tsx::cursor cursor {source};

  cursor.advance();
  cursor.advance();
  EXPECT_EQ(cursor.current(), U'x');
  EXPECT_EQ(cursor.location(), (tsx::coordinate {1, 3}));
}


TEST(CursorTest, EndOfInput)
{
  tsx::string_source source {"a\n"};
  tsx::cursor cursor {source};

  cursor.advance();
  EXPECT_FALSE(cursor.advance().has_value());
  EXPECT_TRUE(cursor.at_end());
  EXPECT_EQ(cursor.location(), (tsx::coordinate {2, 1}));
  EXPECT_EQ(cursor.previous(), (tsx::coordinate {1, 2}));

  // Advancing past the end changes nothing
  EXPECT_FALSE(cursor.advance().has_value());
  EXPECT_EQ(cursor.location(), (tsx::coordinate {2, 1}));
  EXPECT_EQ(cursor.previous(), (tsx::coordinate {1, 2}));
}


TEST(CursorTest, EmptyInput)
{
  tsx::string_source source {""};
  tsx::cursor cursor {source};

  EXPECT_TRUE(cursor.at_end());
  EXPECT_EQ(cursor.location(), (tsx::coordinate {1, 1}));
}


TEST(CursorTest, ReadsLazily)
{
  counting_source source {U"xy"};
  tsx::cursor cursor {source};

  EXPECT_EQ(source.reads(), 0);
  EXPECT_EQ(cursor.location(), (tsx::coordinate {1, 1}));
  EXPECT_EQ(source.reads(), 0);

  EXPECT_EQ(cursor.current(), U'x');
  EXPECT_EQ(cursor.current(), U'x');
  EXPECT_EQ(source.reads(), 1);

  EXPECT_EQ(cursor.advance(), U'y');
  EXPECT_EQ(source.reads(), 2);
}


TEST(CoordinateTest, After)
{
  const tsx::coordinate c {3, 7};
  EXPECT_EQ(c.after(U'x'), (tsx::coordinate {3, 8}));
  EXPECT_EQ(c.after(U'😀'), (tsx::coordinate {3, 8}));
  EXPECT_EQ(c.after(U'\n'), (tsx::coordinate {4, 1}));
  // Carriage return is an ordinary character
  EXPECT_EQ(c.after(U'\r'), (tsx::coordinate {3, 8}));
}
