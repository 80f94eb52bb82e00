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

#include <cstdlib> // For strtoul()

#include "misc.hpp"
#include "url.hpp"

namespace libsysproxy {

static inline bool _is_scheme_char(char c) {
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
	       (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

// An empty port is allowed and means the scheme's default
static inline bool _is_port(const string& str) {
	if (str.empty())
		return true;
	if (str.size() > 5)
		return false;
	if (str.find_first_not_of("0123456789") != string::npos)
		return false;
	return strtoul(str.c_str(), NULL, 10) <= 65535;
}

bool url::is_valid(const string __url) {
	try                  { url tmp(__url); }
	catch (parse_error&) { return false; }
	return true;
}

url::url(const string& url) {
	// Break apart our url into 3 sections: scheme, authority and path
	// We'll do further parsing of the authority a bit later
	string::size_type sep = url.find("://");
	if (sep == string::npos || sep == 0)
		throw parse_error("Invalid URL: " + url);
	for (string::size_type i=0 ; i < sep ; i++)
		if (!_is_scheme_char(url[i]))
			throw parse_error("Invalid URL: " + url);

	this->scheme = lowercase(url.substr(0, sep));

	string rest = url.substr(sep + 3);
	string auth = rest.substr(0, rest.find_first_of("/?#"));

	// Drop user info, only the host matters
	if (auth.rfind('@') != string::npos)
		auth = auth.substr(auth.rfind('@') + 1);

	// Parse host further. Basically, we're looking for a port.
	string portstr;
	if (auth != "" && auth[0] == '[') {
		// IPv6 literal: [addr] or [addr]:port
		string::size_type close = auth.find(']');
		if (close == string::npos)
			throw parse_error("Invalid URL: " + url);
		this->host = auth.substr(1, close-1);
		if (close+1 < auth.size()) {
			if (auth[close+1] != ':')
				throw parse_error("Invalid URL: " + url);
			portstr = auth.substr(close+2);
			if (!_is_port(portstr))
				throw parse_error("Invalid port in URL: " + url);
		}
	}
	else if (auth.rfind(':') != string::npos) {
		this->host = auth.substr(0, auth.rfind(':'));
		portstr    = auth.substr(auth.rfind(':') + 1);
		if (!_is_port(portstr))
			throw parse_error("Invalid port in URL: " + url);
	}
	else
		this->host = auth;

	// Only file:// urls may omit the host
	if (this->host == "" && this->scheme != "file")
		throw parse_error("Missing host in URL: " + url);
}

string url::get_host() const {
	return this->host;
}

string url::get_scheme() const {
	return this->scheme;
}

}
