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

#include "misc.hpp"
#include "proxy_config.hpp"

namespace libsysproxy {

static const char *SUPPORTED_SCHEMES[] = {
	"http",
	"https",
	"ftp",
	SPX_SCHEME_WILDCARD,
	NULL
};

static bool _is_supported_scheme(const string& scheme) {
	for (int i=0 ; SUPPORTED_SCHEMES[i] ; i++)
		if (scheme == SUPPORTED_SCHEMES[i])
			return true;
	return false;
}

// Lower case, without the trailing dot of a fully qualified name
static string _normalize_host(const string& host) {
	string tmp = lowercase(host);
	if (tmp.size() > 0 && tmp[tmp.size()-1] == '.')
		tmp = tmp.substr(0, tmp.size()-1);
	return tmp;
}

static bool _bypass_matches(const string& pattern, const string& host) {
	string ptn = _normalize_host(pattern);

	// *.suffix and .suffix need at least one more label in front of suffix
	string suffix;
	if (ptn.compare(0, 2, "*.") == 0)
		suffix = ptn.substr(2);
	else if (ptn[0] == '.')
		suffix = ptn.substr(1);
	if (suffix != "")
		return host.size() > suffix.size() && ends_with(host, "." + suffix);

	return ptn == host;
}

proxy_config::proxy_config() : exclude_simple(false) {}

proxy_config::proxy_config(const proxy_map& proxies, const vector<string>& bypass, bool exclude_simple)
	: exclude_simple(exclude_simple) {
	for (proxy_map::const_iterator i=proxies.begin() ; i != proxies.end() ; i++) {
		string scheme  = lowercase(trim(i->first));
		string address = trim(i->second);

		if (!_is_supported_scheme(scheme))
			throw parse_error("Unsupported proxy scheme: " + i->first);
		if (address == "")
			throw parse_error("Empty proxy address for scheme: " + scheme);
		if (this->proxies.find(scheme) != this->proxies.end())
			throw parse_error("Duplicate proxy scheme: " + scheme);

		this->proxies[scheme] = address;
	}

	for (vector<string>::const_iterator i=bypass.begin() ; i != bypass.end() ; i++) {
		string pattern = trim(*i);
		if (pattern == "")
			continue;

		bool seen = false;
		for (vector<string>::iterator j=this->bypass.begin() ; j != this->bypass.end() && !seen ; j++)
			seen = lowercase(*j) == lowercase(pattern);
		if (!seen)
			this->bypass.push_back(pattern);
	}
}

const proxy_config::proxy_map& proxy_config::get_proxies() const {
	return this->proxies;
}

const vector<string>& proxy_config::get_bypass() const {
	return this->bypass;
}

bool proxy_config::get_exclude_simple() const {
	return this->exclude_simple;
}

bool proxy_config::get_proxy(const string& scheme, string& address) const {
	proxy_map::const_iterator it = this->proxies.find(lowercase(scheme));
	if (it == this->proxies.end())
		return false;
	address = it->second;
	return true;
}

bool proxy_config::is_bypassed(const string& host) const {
	string dst    = _normalize_host(host);
	bool   simple = dst.find('.') == string::npos;

	if (simple && this->exclude_simple)
		return true;

	for (vector<string>::const_iterator i=this->bypass.begin() ; i != this->bypass.end() ; i++) {
		if (lowercase(*i) == SPX_BYPASS_LOCAL) {
			if (simple)
				return true;
			continue;
		}
		if (_bypass_matches(*i, dst))
			return true;
	}

	return false;
}

bool proxy_config::select(const url& dst, string& address) const {
	if (this->is_bypassed(dst.get_host()))
		return false;

	if (this->get_proxy(dst.get_scheme(), address))
		return true;
	return this->get_proxy(SPX_SCHEME_WILDCARD, address);
}

bool select(const proxy_config& config, const url& dst, string& address) {
	return config.select(dst, address);
}

bool select(const proxy_config& config, const string& dst, string& address) {
	try {
		return config.select(url(dst), address);
	}
	catch (parse_error&) {
		return false;
	}
}

}
