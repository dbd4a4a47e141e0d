#include "tinysexpr/form_printer.hpp"
#include "tinysexpr/format.hpp"
#include "tinysexpr/reader.hpp"

#include <gtest/gtest.h>
#include <format>
#include <sstream>
#include <stdexcept>
#include <string>


static const tsx::form*
read_first(tsx::reader &reader)
{
  const tsx::form *x = reader.next();
  if (x == nullptr)
    throw std::runtime_error {"no form in " + reader.source_name()};
  return x;
}


TEST(FormPrinterTest, RawPrint)
{
  const std::string text = "( a  (b\n c) () |d e|)";
  tsx::string_source source {text};
  tsx::reader reader {source};
  const tsx::form *x = read_first(reader);

  std::ostringstream buf;
  tsx::raw_printer.print(buf, *x);
  EXPECT_EQ(buf.str(), "(a (b c) () |d e|)");

  std::ostringstream streamed;
  streamed << *x;
  EXPECT_EQ(streamed.str(), buf.str());
}


TEST(FormPrinterTest, MaxDepth)
{
  const std::string text = "(a (b (c)) d)";
  tsx::string_source source {text};
  tsx::reader reader {source};
  const tsx::form *x = read_first(reader);

  std::ostringstream depth0, depth1, depth2;
  tsx::raw_printer.print(depth0, *x, 0);
  tsx::raw_printer.print(depth1, *x, 1);
  tsx::raw_printer.print(depth2, *x, 2);
  EXPECT_EQ(depth0.str(), "(...)");
  EXPECT_EQ(depth1.str(), "(a (...) d)");
  EXPECT_EQ(depth2.str(), "(a (b (...)) d)");
}


TEST(FormPrinterTest, DeepNesting)
{
  const size_t depth = 100000;
  const std::string text = std::string(depth, '(') + "x" + std::string(depth, ')');
  const tsx::stl::vector<const tsx::form*> forms = tsx::read_all(text);
  ASSERT_EQ(forms.size(), 1);

  std::ostringstream buf;
  tsx::raw_printer.print(buf, *forms.front());
  EXPECT_EQ(buf.str(), text);

  std::ostringstream limited;
  tsx::raw_printer.print(limited, *forms.front(), 3);
  EXPECT_EQ(limited.str(), "(((...)))");
}


TEST(FormPrinterTest, Colorized)
{
  const std::string text = "(a (b))";
  tsx::string_source source {text};
  tsx::reader reader {source};
  const tsx::form *x = read_first(reader);

  std::ostringstream buf;
  tsx::colorized_printer.print(buf, *x);
  const std::string out = buf.str();
  EXPECT_NE(out.find("\e[31m("), std::string::npos);
  EXPECT_NE(out.find("\e[33m("), std::string::npos);
  EXPECT_NE(out.find("b"), std::string::npos);
}


TEST(FormPrinterTest, ValuesWithoutStreamOperator)
{
  struct opaque { };

  tsx::string_source source {"(x y)"};
  tsx::basic_reader<opaque> reader {
      source, {}, [](std::string_view, const tsx::span &) { return opaque {}; }};
  const tsx::basic_form<opaque> *x = reader.next();
  ASSERT_NE(x, nullptr);

  std::ostringstream buf;
  tsx::raw_printer.print(buf, *x);
  EXPECT_EQ(buf.str(), "(#<atom> #<atom>)");
}


TEST(FormatTest, Coordinates)
{
  EXPECT_EQ(std::format("{}", tsx::coordinate {2, 5}), "2:5");
  EXPECT_EQ(std::format("{}", tsx::span {{1, 1}, {3, 4}}), "1:1-3:4");

  std::ostringstream buf;
  buf << tsx::coordinate {7, 8} << ' ' << tsx::span {{1, 2}, {3, 4}};
  EXPECT_EQ(buf.str(), "7:8 1:2-3:4");
}


TEST(FormatTest, Forms)
{
  const std::string text = "(a (b (c)))";
  tsx::string_source source {text};
  tsx::reader reader {source};
  const tsx::form *x = read_first(reader);

  EXPECT_EQ(std::format("{}", *x), "(a (b (c)))");
  EXPECT_EQ(std::format("{:#1}", *x), "(a (...))");
  EXPECT_NE(std::format("{:c}", *x).find("\e[31m"), std::string::npos);
}
