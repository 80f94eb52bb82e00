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

#include <cerrno>  // For errno
#include <cstring> // For strerror()
#include <fstream>
#include <sstream> // For int/string conversion (using stringstream)

#include <sys/types.h>
#include <sys/stat.h> // For stat()

#include "config_file.hpp"
#include "misc.hpp"

namespace libsysproxy {

template <class T>
static inline string _to_string (const T& t) {
	stringstream ss;
	ss << t;
	return ss.str();
}

bool config_file::get_value(const string& key, string& value) const {
	map<string, string>::const_iterator it = this->values.find(key);
	if (it == this->values.end())
		return false;
	value = it->second;
	return true;
}

bool config_file::load(const string& filename) {
	// A missing file is not an error, there is just nothing configured
	struct stat st;
	if (stat(filename.c_str(), &st)) {
		if (errno == ENOENT || errno == ENOTDIR)
			return false;
		throw detection_error("Unable to stat " + filename + ": " + strerror(errno));
	}

	ifstream file(filename.c_str());
	if (!file.is_open())
		throw detection_error("Unable to open " + filename);

	this->load(file);
	return true;
}

void config_file::load(istream& stream) {
	map<string, string> parsed;
	int lineno = 0;

	for (string line ; getline(stream, line) ; ) {
		lineno++;

		// Strip the line
		line = trim(line);

		// Check for comment and/or empty line
		if (line == "" || line[0] == '#') continue;

		// There has to be an equals sign followed by a quote
		string::size_type eq = line.find("=\"");
		if (eq == string::npos || eq == 0)
			throw parse_error("Malformed line " + _to_string(lineno) + ": " + line);

		// The value ends at the next quote, anything after it is ignored
		string value = line.substr(eq + 2);
		if (value.find('"') != string::npos)
			value = value.substr(0, value.find('"'));

		parsed[trim(line.substr(0, eq))] = value;
	}

	if (stream.bad())
		throw detection_error("Read error after line " + _to_string(lineno));

	this->values.swap(parsed);
}

}
