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

#ifndef MODULES_HPP_
#define MODULES_HPP_

#include "config.hpp"
#include "detector.hpp"

#ifdef __APPLE__
#include <CoreFoundation/CoreFoundation.h>
#endif

namespace libsysproxy {

using namespace std;

/*
 * Environment: HTTP_PROXY, HTTPS_PROXY, FTP_PROXY, ALL_PROXY and NO_PROXY,
 * upper case first, then lower case.
 */
class DLL_PUBLIC envvar_detector : public detector {
public:
	typedef const char* (*getenv_func)(const char* name);

	SPX_DETECTOR_ID("envvar");

	// lookup defaults to getenv()
	envvar_detector(getenv_func lookup=NULL);
	bool get_proxy_config(proxy_config& config);

private:
	string getvar(const string& name) const;

	getenv_func lookup;
};

/*
 * /etc/sysconfig/proxy, as written by YaST and read by SUSE/Red Hat tools.
 */
class DLL_PUBLIC sysconfig_detector : public detector {
public:
	SPX_DETECTOR_ID("sysconfig");

	sysconfig_detector(const string& filename=SYSCONFIG_PROXY_FILE);
	bool get_proxy_config(proxy_config& config);

private:
	string filename;
};

/*
 * Windows: per-user Internet Settings, then the WinHTTP machine default.
 */
#ifdef _WIN32
class DLL_PUBLIC w32reg_detector : public detector {
public:
	SPX_DETECTOR_ID("w32reg");

	bool get_proxy_config(proxy_config& config);
};
#endif

// ProxyServer: "host:port" or "http=host:port;https=host:port;..."
DLL_PUBLIC proxy_config::proxy_map parse_w32_proxy_server(const string& value);

// ProxyOverride: "host;*.domain;<local>"
DLL_PUBLIC vector<string> parse_w32_proxy_override(const string& value);

/*
 * macOS: proxies dictionary of the SystemConfiguration dynamic store.
 */
#ifdef __APPLE__
class DLL_PUBLIC macosx_detector : public detector {
public:
	SPX_DETECTOR_ID("macosx");

	bool get_proxy_config(proxy_config& config);
};

/**
 * Reads a SCDynamicStoreCopyProxies() style dictionary.
 * @config Set to the configuration of the enabled protocols
 * @return false if no protocol is enabled
 */
DLL_PUBLIC bool parse_macosx_proxies(CFDictionaryRef settings, proxy_config& config);
#endif

}

#endif /* MODULES_HPP_ */
