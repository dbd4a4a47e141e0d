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


#include "tinysexpr/form_printer.hpp"


const tsx::form_printer::color_palette tsx::form_printer::default_palette {
    {
        "\e[31m", // Red
        "\e[33m", // Yellow
        "\e[32m", // Green
        "\e[36m", // Cyan
        "\e[34m", // Blue
        "\e[35m", // Magenta
    },
    "\e[38;5;15m",
    "\e[2m"};


const tsx::form_printer tsx::raw_printer;
const tsx::form_printer tsx::colorized_printer {tsx::form_printer::default_palette};
