#pragma once

#include "tinysexpr/form.hpp"

#include <string>


void
init_readline();

void
cleanup_readline();

bool
prompt_line(const std::string &prompt, std::string &line);

/**
 * Offer the atoms of \p x for Tab-completion in later lines
 */
void
remember_atoms(const tsx::form &x);
