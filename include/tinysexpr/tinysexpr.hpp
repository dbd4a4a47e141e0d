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

/**
 * \defgroup lisp Reader
 * Reading S-expressions from character sources
 *
 * \defgroup memory Memory
 * Collector-managed allocation of forms
 *
 * \defgroup utils Utilities
 * Formatting and logging
 */

#include "tinysexpr/char_source.hpp"
#include "tinysexpr/exceptions.hpp"
#include "tinysexpr/form.hpp"
#include "tinysexpr/form_printer.hpp"
#include "tinysexpr/format.hpp"
#include "tinysexpr/logging.hpp"
#include "tinysexpr/reader.hpp"
#include "tinysexpr/reader_config.hpp"
