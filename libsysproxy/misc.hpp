/*******************************************************************************
 * libsysproxy - A library for system proxy detection
 * Copyright (C) 2026 The libsysproxy authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 ******************************************************************************/

#ifndef MISC_HPP_
#define MISC_HPP_

#include <string>
#include <vector>

#include "config.hpp"

namespace libsysproxy {

using namespace std;

#define SPX_WHITESPACE " \t\r\n"

/**
 * Strips leading and trailing characters found in set
 * @str The string to strip
 * @set The characters to remove
 * @return A copy of str without the leading and trailing characters
 */
DLL_PUBLIC string trim(const string& str, const char* set=SPX_WHITESPACE);

/**
 * @return A copy of str with all ASCII letters in lower case
 */
DLL_PUBLIC string lowercase(string str);

/**
 * @return A copy of str with all ASCII letters in upper case
 */
DLL_PUBLIC string uppercase(string str);

/**
 * Splits a string on any of the delimiter characters. Each token is
 * trimmed and empty tokens are dropped.
 * @str The string to split
 * @delimiters Set of single character delimiters
 * @return The tokens, in order
 */
DLL_PUBLIC vector<string> split(const string& str, const char* delimiters);

DLL_PUBLIC bool ends_with(const string& str, const string& suffix);

}

#endif /* MISC_HPP_ */
