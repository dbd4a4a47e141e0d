#include "tinysexpr/source_location.hpp"
#include "tinysexpr/exceptions.hpp"
#include "tinysexpr/reader.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <ostream>
#include <string>
#include <utility>


namespace {

class SourceFileTest: public testing::Test {
  protected:
  void
  SetUp() override
  {
    m_path = std::filesystem::temp_directory_path() /
             std::format("tinysexpr_{}.lisp",
                         testing::UnitTest::GetInstance()->current_test_info()->name());
  }

  void
  TearDown() override
  { std::filesystem::remove(m_path); }

  void
  write(const std::string &text)
  {
    std::ofstream file {m_path, std::ios::binary};
    file << text;
  }

  std::filesystem::path m_path;
};

} // anonymous namespace


TEST(SourceLocationTest, InMemorySource)
{
  EXPECT_EQ(tsx::display_location("<string>", {{1, 2}, {1, 4}}),
            "in <string>: 1:2 to 1:4");
}


TEST_F(SourceFileTest, HighlightsSpan)
{
  write("(a\n  (b😀 c)\n)\n");

  const std::string out =
      tsx::display_location(m_path.string(), {{2, 3}, {2, 5}}, 0, "<hl>", "");

  EXPECT_NE(out.find(std::format("in {}:2:3 to 2:5\n", m_path.string())),
            std::string::npos);
  EXPECT_NE(out.find("   2 |   \e[0m<hl>(b😀\e[0m c)"), std::string::npos);
  // No context lines requested
  EXPECT_EQ(out.find("   1 | "), std::string::npos);
  EXPECT_EQ(out.find("   3 | "), std::string::npos);
}


TEST_F(SourceFileTest, ContextLines)
{
  write("(a\n b\n c\n d\n e)\n");

  const std::string out = tsx::display_location(m_path.string(), {{3, 2}, {3, 2}}, 1);
  EXPECT_EQ(out.find("   1 | "), std::string::npos);
  EXPECT_NE(out.find("   2 | "), std::string::npos);
  EXPECT_NE(out.find("   3 | "), std::string::npos);
  EXPECT_NE(out.find("   4 | "), std::string::npos);
  EXPECT_EQ(out.find("   5 | "), std::string::npos);
}


TEST_F(SourceFileTest, MissingFile)
{
  EXPECT_EQ(tsx::display_location(m_path.string(), {{1, 1}, {1, 1}}),
            std::format("Could not open file: {}", m_path.string()));
}


TEST_F(SourceFileTest, ErrorInFile)
{
  write("(define x\n  (f y)\n");

  std::ifstream file {m_path, std::ios::binary};
  tsx::stream_source source {file, m_path.string()};
  tsx::reader reader {source};

  try
  {
    reader.next();
    FAIL() << "expected tsx::unexpected_eof";
  }
  catch (const tsx::unexpected_eof &exn)
  {
    EXPECT_EQ(exn.source(), m_path.string());
    EXPECT_EQ(exn.where(), (tsx::coordinate {3, 1}));
    EXPECT_EQ(std::string {exn.what()},
              std::format("{}:3:1: unexpected end of file", m_path.string()));

    const std::string shown = exn.display();
    EXPECT_EQ(shown.find(exn.what()), 0);
    EXPECT_NE(shown.find("   2 |   (f y)"), std::string::npos);
  }
}


TEST_F(SourceFileTest, ErrorInMissingFile)
{
  // Rendering the source may fail, so display() must be allowed to throw
  static_assert(not noexcept(std::declval<const tsx::syntax_error&>().display(
      std::declval<std::ostream&>())));

  const tsx::unexpected_eof exn {{1, 1}, m_path.string()};
  const std::string shown = exn.display();
  EXPECT_EQ(shown.find(exn.what()), 0);
  EXPECT_NE(shown.find("Could not open file"), std::string::npos);
}


TEST(SyntaxErrorTest, DisplayInMemory)
{
  const tsx::unexpected_char exn {U'(', U'x', {4, 2}, "<stdin>"};
  EXPECT_EQ(exn.display(), "<stdin>:4:2: expected '(', got 'x'");
}
