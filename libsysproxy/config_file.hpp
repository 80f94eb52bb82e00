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

#ifndef CONFIG_FILE_HPP_
#define CONFIG_FILE_HPP_

#include <istream>
#include <map>
#include <string>

#include "errors.hpp"

namespace libsysproxy {

using namespace std;

// Reader for shell style KEY="value" files, as found in /etc/sysconfig
class DLL_PUBLIC config_file {
public:
	bool get_value(const string& key, string& value) const;

	// Returns false if the file does not exist. Throws detection_error if it
	// exists but cannot be read and parse_error if a line is malformed.
	bool load(const string& filename);
	void load(istream& stream);

private:
	map<string, string> values;
};

}

#endif /*CONFIG_FILE_HPP_*/
