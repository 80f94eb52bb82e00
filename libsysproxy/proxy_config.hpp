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

#ifndef PROXY_CONFIG_HPP_
#define PROXY_CONFIG_HPP_

#include <map>
#include <string>
#include <vector>

#include "url.hpp"

namespace libsysproxy {

using namespace std;

#define SPX_SCHEME_WILDCARD "*"
#define SPX_BYPASS_LOCAL    "<local>"

/**
 * The proxy configuration produced by one successful detector: the scheme to
 * proxy address mapping plus the bypass rules.
 *
 * Instances are never modified after construction, so one configuration can
 * be shared between threads without locking.
 */
class DLL_PUBLIC proxy_config {
public:
	typedef map<string, string> proxy_map;

	proxy_config();

	/**
	 * @proxies Scheme (http, https, ftp or *) to host[:port] mapping.
	 *          Schemes are case insensitive.
	 * @bypass Bypass patterns: exact hosts, *.suffix, .suffix or <local>.
	 *         Empty and duplicate entries are dropped.
	 * @exclude_simple Bypass every host without a dot
	 * @throws parse_error on an unknown scheme or an empty address
	 */
	proxy_config(const proxy_map& proxies, const vector<string>& bypass, bool exclude_simple=false);

	const proxy_map&      get_proxies()        const;
	const vector<string>& get_bypass()         const;
	bool                  get_exclude_simple() const;

	// Address for scheme, without falling back to the wildcard entry
	bool get_proxy(const string& scheme, string& address) const;

	// True if connections to host must not use a proxy
	bool is_bypassed(const string& host) const;

	/**
	 * Picks the proxy to use for dst.
	 * @address Set to the proxy address when one applies
	 * @return false if dst is bypassed or no entry covers its scheme
	 */
	bool select(const url& dst, string& address) const;

private:
	proxy_map      proxies;
	vector<string> bypass;
	bool           exclude_simple;
};

DLL_PUBLIC bool select(const proxy_config& config, const url& dst, string& address);

// As above, an unparseable dst selects no proxy
DLL_PUBLIC bool select(const proxy_config& config, const string& dst, string& address);

}

#endif /* PROXY_CONFIG_HPP_ */
