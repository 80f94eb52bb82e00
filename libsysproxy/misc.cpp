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

#include <algorithm> // For transform()
#include <cctype>    // For tolower(), toupper()

#include "misc.hpp"

namespace libsysproxy {

string trim(const string& str, const char* set) {
	const string::size_type first = str.find_first_not_of(set);
	if (first == string::npos)
		return "";
	return str.substr(first, str.find_last_not_of(set)-first+1);
}

static char _tolower(char c) {
	return (char) ::tolower((unsigned char) c);
}

static char _toupper(char c) {
	return (char) ::toupper((unsigned char) c);
}

string lowercase(string str) {
	transform(str.begin(), str.end(), str.begin(), _tolower);
	return str;
}

string uppercase(string str) {
	transform(str.begin(), str.end(), str.begin(), _toupper);
	return str;
}

vector<string> split(const string& str, const char* delimiters) {
	vector<string> tokens;

	string::size_type start = 0;
	while (start <= str.size()) {
		string::size_type end = str.find_first_of(delimiters, start);
		if (end == string::npos)
			end = str.size();

		string token = trim(str.substr(start, end-start));
		if (token != "")
			tokens.push_back(token);

		start = end + 1;
	}

	return tokens;
}

bool ends_with(const string& str, const string& suffix) {
	if (suffix.size() > str.size())
		return false;
	return str.compare(str.size()-suffix.size(), suffix.size(), suffix) == 0;
}

}
