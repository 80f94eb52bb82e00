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

#include <cstdlib>   // For malloc(), free()
#include <cstring>   // For strdup()
#include <stdexcept> // For exception

#include "detector.hpp"
#include "proxy.h"

#ifdef _WIN32
#define strdup _strdup
#endif

using namespace libsysproxy;
using namespace std;

struct _spxProxyConfig {
	proxy_config config;
};

// Copy the strings into a NULL-terminated array
// Return NULL on memory allocation failure
static char** _to_strv(const vector<string>& strings) {
	char** retval = (char**) malloc(sizeof(char*) * (strings.size() + 1));
	if (!retval) return NULL;

	retval[strings.size()] = NULL;
	for (size_t i=0 ; i < strings.size() ; i++) {
		retval[i] = strdup(strings[i].c_str());
		if (retval[i] == NULL) {
			for (size_t j=0 ; j < i ; j++)
				free(retval[j]);
			free(retval);
			return NULL;
		}
	}
	return retval;
}

extern "C" DLL_PUBLIC struct _spxProxyConfig *spx_proxy_config_detect(void) {
	struct _spxProxyConfig* retval = NULL;

	try {
		retval = new struct _spxProxyConfig;
		if (detect_proxy_config(retval->config))
			return retval;
		delete retval;
		return NULL;
	} catch (std::exception&) {
		// Return NULL on any exception
		delete retval;
		return NULL;
	}
}

extern "C" DLL_PUBLIC char *spx_proxy_config_select(struct _spxProxyConfig *self, const char *url) {
	string address;

	if (!self || !url)
		return NULL;

	try {
		if (!select(self->config, string(url), address))
			return NULL;
	} catch (std::exception&) {
		return NULL;
	}
	return strdup(address.c_str());
}

extern "C" DLL_PUBLIC char **spx_proxy_config_get_proxies(struct _spxProxyConfig *self) {
	vector<string> proxies;

	if (!self)
		return NULL;

	try {
		const proxy_config::proxy_map& configured = self->config.get_proxies();
		for (proxy_config::proxy_map::const_iterator i=configured.begin() ; i != configured.end() ; i++)
			proxies.push_back(i->first + "=" + i->second);
	} catch (std::exception&) {
		return NULL;
	}
	return _to_strv(proxies);
}

extern "C" DLL_PUBLIC char **spx_proxy_config_get_bypass(struct _spxProxyConfig *self) {
	if (!self)
		return NULL;
	return _to_strv(self->config.get_bypass());
}

extern "C" DLL_PUBLIC int spx_proxy_config_get_exclude_simple(struct _spxProxyConfig *self) {
	return self && self->config.get_exclude_simple() ? 1 : 0;
}

extern "C" DLL_PUBLIC void spx_proxy_config_free(struct _spxProxyConfig *self) {
	delete self;
}

extern "C" DLL_PUBLIC void spx_strv_free(char **strv) {
	if (!strv)
		return;

	for (size_t i = 0; strv[i]; ++i)
		free(strv[i]);

	free(strv);
}

extern "C" DLL_PUBLIC void spx_string_free(char *str) {
	free(str);
}
