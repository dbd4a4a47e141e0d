#include "repl.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <vector>

// Readline headers
#include <readline/readline.h>
#include <readline/history.h>


static const char history_file[] = ".tinysexpr_history";

// Atoms entered so far, offered for completion
static std::set<std::string> seen_atoms;


// Read a line with prompt using readline
bool
prompt_line(const std::string &prompt, std::string &line)
{
  char *input = readline(prompt.c_str());

  // EOF (Ctrl-D)
  if (!input)
    return false;

  line = input;

  if (not line.empty())
    add_history(input);

  free(input);

  return true;
}


static char *
_atom_generator(const char *text, int state)
{
  static std::vector<std::string> matches;
  static size_t index;

  if (state == 0)
  {
    matches.clear();
    index = 0;

    const std::string prefix {text};
    for (const std::string &atom : seen_atoms)
    {
      if (atom.compare(0, prefix.length(), prefix) == 0)
        matches.push_back(atom);
    }
  }

  if (index < matches.size())
    return strdup(matches[index++].c_str());

  return nullptr;
}


static char **
_tinysexpr_completion(const char *text, [[maybe_unused]] int start,
                      [[maybe_unused]] int end)
{
  // No fallback to file name completion
  rl_attempted_completion_over = 1;
  return rl_completion_matches(text, _atom_generator);
}


void
init_readline()
{
  rl_readline_name = "tinysexpr";
  rl_attempted_completion_function = _tinysexpr_completion;
  rl_basic_word_break_characters = const_cast<char*>(" \t\n()\"|;");
  rl_bind_key('\t', rl_complete);

  read_history(history_file);
}


// Save history and clean up readline resources
void
cleanup_readline()
{
  write_history(history_file);
  history_truncate_file(history_file, 500);
}


void
remember_atoms(const tsx::form &x)
{
  for (const tsx::form::element &elt : x)
  {
    if (tsx::is_form(elt))
      remember_atoms(tsx::form_of(elt));
    else
    {
      const tsx::stl::string &text = tsx::atom_of(elt);
      seen_atoms.emplace(text.begin(), text.end());
    }
  }
}
