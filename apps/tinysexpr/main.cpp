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
#include "repl.hpp"

#include "tinysexpr/tinysexpr.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <ios>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

namespace std {
namespace fs = std::filesystem;
}


struct print_options {
  bool colored = false;
  bool spans = false;
  int maxdepth = -1;
};


static void
print_form(const tsx::form &x, const print_options &opts)
{
  if (opts.spans)
    std::cout << std::format("{} ", x.location());

  const tsx::form_printer &p = opts.colored ? tsx::colorized_printer
                                            : tsx::raw_printer;
  p.print(std::cout, x, opts.maxdepth);
  std::cout << std::endl;
}


// Decode a command line argument holding a single character
static char32_t
parse_character(const std::string &arg, std::string_view what)
{
  tsx::string_source source {arg};
  const std::optional<char32_t> c = source.read();
  if (not c or source.read())
    throw std::runtime_error {
        std::format("{} must be a single character, got '{}'", what, arg)};
  return *c;
}


static int
read_and_print(tsx::char_source &source, const tsx::reader_config &config,
               const print_options &opts)
{
  using namespace tsx;

  try
  {
    reader forms {source, config};
    for (const form *x : forms)
      print_form(*x, opts);
    info("\e[1mread {} forms from {}\e[0m", forms.count(), source.name());
  }
  catch (const syntax_error &exn)
  {
    try
    { error("{}", exn.display()); }
    catch (const std::exception &displayexn)
    { error("{} (source not shown: {})", exn.what(), displayexn.what()); }
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}


static void
read_print_loop(const tsx::reader_config &config, const print_options &opts)
{
  using namespace tsx;

  init_readline();

  bool at_eof = false;
  while (not at_eof)
  {
    // A fresh session per syntax error; the failed one can't continue
    bool between_forms = true;
    chunk_source source {[&](std::string &chunk) {
      std::string line;
      if (not prompt_line(between_forms ? "> " : ". ", line))
      {
        at_eof = true;
        return false;
      }
      between_forms = false;
      chunk = line + "\n";
      return true;
    }, "<stdin>"};

    try
    {
      reader forms {source, config};
      while (true)
      {
        between_forms = true;
        const form *x = forms.next();
        if (x == nullptr)
          break;

        print_form(*x, opts);
        remember_atoms(*x);
      }
    }
    catch (const syntax_error &exn)
    {
      std::cout << exn.what() << std::endl;
    }
  }

  cleanup_readline();
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace tsx;

  std::string verbosity {loglevel_name(loglevel::warning)};
  std::string comment;
  std::vector<std::string> delimiters;
  print_options opts;

  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help", "produce help message")
    ("input-file", po::value<std::string>(), "input file to read, '-' for stdin")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity")
    ("comment,c", po::value<std::string>(&comment), "comment character (default ';')")
    ("delimiter,d", po::value<std::vector<std::string>>(&delimiters), "additional delimiter without escapes")
    ("color", "colorize brackets by depth")
    ("spans", "print the span of every form")
    ("depth", po::value<int>(&opts.maxdepth), "print at most this many levels of nesting");

  po::positional_options_description posdesc;
  posdesc.add("input-file", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [input-file]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  reader_config config;
  try
  {
    log_level = parse_loglevel(verbosity);

    if (varmap.contains("comment"))
      config.comment = parse_character(comment, "comment character");
    for (const std::string &delim : delimiters)
      config.delimiters[parse_character(delim, "delimiter")] = delimiter {};
    config.validate();
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }

  opts.colored = varmap.contains("color");
  opts.spans = varmap.contains("spans");

  if (varmap.contains("input-file"))
  {
    const std::fs::path inputpath = varmap["input-file"].as<std::string>();
    if (inputpath == "-")
    {
      stream_source source {std::cin, "<stdin>"};
      return read_and_print(source, config, opts);
    }

    std::ifstream inputfile {inputpath, std::ios::binary};
    if (not inputfile.is_open())
    {
      error("Could not open input file '{}'", inputpath.c_str());
      return EXIT_FAILURE;
    }

    info("\e[1mreading {}\e[0m", inputpath.c_str());
    stream_source source {inputfile, inputpath.string()};
    return read_and_print(source, config, opts);
  }

  if (isatty(STDIN_FILENO))
  {
    read_print_loop(config, opts);
    return EXIT_SUCCESS;
  }

  stream_source source {std::cin, "<stdin>"};
  return read_and_print(source, config, opts);
}
