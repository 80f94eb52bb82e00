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

#include <cstring>
#include <iostream>
#include <string>

#include "detector.hpp"
#include "misc.hpp"

using namespace libsysproxy;
using namespace std;

static void print_config(const proxy_config& config) {
	const proxy_config::proxy_map& proxies = config.get_proxies();
	for (proxy_config::proxy_map::const_iterator i=proxies.begin() ; i != proxies.end() ; i++)
		cout << i->first << "=" << i->second << endl;

	const vector<string>& bypass = config.get_bypass();
	for (size_t i=0 ; i < bypass.size() ; i++)
		cout << "bypass=" << bypass[i] << endl;

	cout << "exclude_simple=" << (config.get_exclude_simple() ? "yes" : "no") << endl;
}

static void print_proxy(bool found, const proxy_config& config, const string& dst) {
	string address;

	if (!url::is_valid(dst)) {
		cerr << "Invalid URL: " << dst << endl;
		return;
	}
	if (found && select(config, dst, address))
		cout << address << endl;
	else
		cout << "direct://" << endl;
}

int main(int argc, char** argv) {
	proxy_config config;

	if (argc > 1 && (!strcmp(argv[1], "-h") || !strcmp(argv[1], "--help"))) {
		cerr << "Usage: " << argv[0] << " [--config | URL ...]" << endl;
		cerr << "Prints the proxy to use for each URL, read from stdin if none are given." << endl;
		return 1;
	}

	bool found = detect_proxy_config(config);

	if (argc > 1 && !strcmp(argv[1], "--config")) {
		if (!found) {
			cout << "direct://" << endl;
			return 0;
		}
		print_config(config);
		return 0;
	}

	if (argc > 1) {
		for (int i=1 ; i < argc ; i++)
			print_proxy(found, config, argv[i]);
		return 0;
	}

	for (string line ; getline(cin, line) ; ) {
		line = trim(line);
		if (line != "")
			print_proxy(found, config, line);
	}
	return 0;
}
