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

#include "../config_file.hpp"
#include "../misc.hpp"
#include "../modules.hpp"

namespace libsysproxy {

static const char *SCHEMES[] = {
	"HTTP",
	"HTTPS",
	"FTP",
	NULL
};

sysconfig_detector::sysconfig_detector(const string& filename) : filename(filename) {}

bool sysconfig_detector::get_proxy_config(proxy_config& config) {
	config_file cf;
	string      enabled;

	if (!cf.load(this->filename))
		return false;

	// PROXY_ENABLED gates everything else in the file
	if (!cf.get_value("PROXY_ENABLED", enabled))
		throw parse_error("Missing PROXY_ENABLED in " + this->filename);
	if (lowercase(trim(enabled)) != "yes")
		return false;

	proxy_config::proxy_map proxies;
	for (int i=0 ; SCHEMES[i] ; i++) {
		string proxy;
		if (cf.get_value(string(SCHEMES[i]) + "_PROXY", proxy) && trim(proxy) != "")
			proxies[lowercase(SCHEMES[i])] = proxy;
	}

	string ignore;
	cf.get_value("NO_PROXY", ignore);

	config = proxy_config(proxies, split(ignore, ","));
	return true;
}

}
