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

#include <cstdlib> // For getenv()

#include "../misc.hpp"
#include "../modules.hpp"

namespace libsysproxy {

static const char *SCHEMES[] = {
	"http",
	"https",
	"ftp",
	NULL
};

static const char* _getenv(const char* name) {
	return getenv(name);
}

envvar_detector::envvar_detector(getenv_func lookup) : lookup(lookup ? lookup : _getenv) {}

// Returns the first non-empty of NAME and name
string envvar_detector::getvar(const string& name) const {
	string names[] = { name, lowercase(name) };

	for (int i=0 ; i < 2 ; i++) {
		const char* value = this->lookup(names[i].c_str());
		if (value && trim(value) != "")
			return trim(value);
	}
	return "";
}

bool envvar_detector::get_proxy_config(proxy_config& config) {
	proxy_config::proxy_map proxies;

	for (int i=0 ; SCHEMES[i] ; i++) {
		string scheme = SCHEMES[i];
		string proxy  = this->getvar(uppercase(scheme) + "_PROXY");
		if (proxy != "")
			proxies[scheme] = proxy;
	}

	// The generic variable only applies if no scheme has its own proxy
	if (proxies.empty()) {
		string proxy = this->getvar("ALL_PROXY");
		if (proxy != "")
			proxies[SPX_SCHEME_WILDCARD] = proxy;
	}

	if (proxies.empty())
		return false;

	config = proxy_config(proxies, split(this->getvar("NO_PROXY"), ",;"));
	return true;
}

}
