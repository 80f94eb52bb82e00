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

#include "../misc.hpp"
#include "../modules.hpp"

#ifdef _WIN32
#include <cstring> // For memset()
#include <winhttp.h>
#endif

namespace libsysproxy {

static const char *SCHEMES[] = {
	"http",
	"https",
	"ftp",
	NULL
};

static bool _is_scheme(const string& scheme) {
	for (int i=0 ; SCHEMES[i] ; i++)
		if (scheme == SCHEMES[i])
			return true;
	return false;
}

proxy_config::proxy_map parse_w32_proxy_server(const string& value) {
	proxy_config::proxy_map proxies;
	vector<string>          entries = split(value, "; \t\r\n");

	for (vector<string>::iterator i=entries.begin() ; i != entries.end() ; i++) {
		string scheme = SPX_SCHEME_WILDCARD;
		string server = *i;

		// Entries without a scheme= prefix apply to all schemes
		if (i->find('=') != string::npos) {
			scheme = lowercase(trim(i->substr(0, i->find('='))));
			server = trim(i->substr(i->find('=') + 1));
			if (!_is_scheme(scheme))
				continue; // socks=, gopher=, ...
		}

		if (server != "" && proxies.find(scheme) == proxies.end())
			proxies[scheme] = server;
	}

	return proxies;
}

vector<string> parse_w32_proxy_override(const string& value) {
	return split(value, "; \t\r\n");
}

#ifdef _WIN32
#define W32REG_INTERNET_SETTINGS L"Software\\Microsoft\\Windows\\CurrentVersion\\Internet Settings"

static string _narrow(const wchar_t* wstr) {
	if (!wstr || !*wstr)
		return "";

	int size = WideCharToMultiByte(CP_UTF8, 0, wstr, -1, NULL, 0, NULL, NULL);
	if (size <= 0)
		throw parse_error("Unable to convert registry string");

	vector<char> buffer(size);
	WideCharToMultiByte(CP_UTF8, 0, wstr, -1, &buffer[0], size, NULL, NULL);
	return string(&buffer[0]);
}

class registry_key {
public:
	registry_key() : key(NULL) {}
	~registry_key() { if (this->key) RegCloseKey(this->key); }

	// Returns false if the key does not exist
	bool open(HKEY root, const wchar_t* path) {
		LONG rc = RegOpenKeyExW(root, path, 0, KEY_READ, &this->key);
		if (rc == ERROR_FILE_NOT_FOUND)
			return false;
		if (rc != ERROR_SUCCESS)
			throw detection_error("Unable to open Internet Settings registry key");
		return true;
	}

	bool get_dword(const wchar_t* name, DWORD& value) {
		DWORD type, size = sizeof(value);
		LONG  rc = RegQueryValueExW(this->key, name, NULL, &type, (LPBYTE) &value, &size);
		if (rc == ERROR_FILE_NOT_FOUND)
			return false;
		if (rc != ERROR_SUCCESS || type != REG_DWORD)
			throw parse_error("Unable to read registry DWORD value");
		return true;
	}

	bool get_string(const wchar_t* name, string& value) {
		DWORD type, size = 0;
		LONG  rc = RegQueryValueExW(this->key, name, NULL, &type, NULL, &size);
		if (rc == ERROR_FILE_NOT_FOUND)
			return false;
		if (rc != ERROR_SUCCESS || (type != REG_SZ && type != REG_EXPAND_SZ))
			throw parse_error("Unable to read registry string value");

		// Room for a terminator the value may lack
		vector<wchar_t> buffer(size / sizeof(wchar_t) + 1, L'\0');
		rc = RegQueryValueExW(this->key, name, NULL, &type, (LPBYTE) &buffer[0], &size);
		if (rc != ERROR_SUCCESS)
			throw detection_error("Unable to read registry string value");

		value = _narrow(&buffer[0]);
		return true;
	}

private:
	HKEY key;
};

class winhttp_proxy_info {
public:
	WINHTTP_PROXY_INFO info;

	winhttp_proxy_info() { memset(&this->info, 0, sizeof(this->info)); }
	~winhttp_proxy_info() {
		if (this->info.lpszProxy)       GlobalFree(this->info.lpszProxy);
		if (this->info.lpszProxyBypass) GlobalFree(this->info.lpszProxyBypass);
	}
};

// Machine wide setting, as set by "netsh winhttp set proxy"
static bool _get_winhttp_config(proxy_config& config) {
	winhttp_proxy_info proxy;
	if (!WinHttpGetDefaultProxyConfiguration(&proxy.info))
		throw detection_error("WinHttpGetDefaultProxyConfiguration failed");

	if (proxy.info.dwAccessType != WINHTTP_ACCESS_TYPE_NAMED_PROXY || !proxy.info.lpszProxy)
		return false;

	proxy_config::proxy_map proxies = parse_w32_proxy_server(_narrow(proxy.info.lpszProxy));
	if (proxies.empty())
		return false;

	config = proxy_config(proxies, parse_w32_proxy_override(_narrow(proxy.info.lpszProxyBypass)));
	return true;
}

bool w32reg_detector::get_proxy_config(proxy_config& config) {
	registry_key key;
	DWORD        enabled;
	string       server, bypass;

	// No per-user setting: use the machine wide one
	if (!key.open(HKEY_CURRENT_USER, W32REG_INTERNET_SETTINGS) || !key.get_dword(L"ProxyEnable", enabled))
		return _get_winhttp_config(config);

	if (enabled == 0)
		return false;

	if (!key.get_string(L"ProxyServer", server) || trim(server) == "")
		return _get_winhttp_config(config);

	proxy_config::proxy_map proxies = parse_w32_proxy_server(server);
	if (proxies.empty())
		return false;

	key.get_string(L"ProxyOverride", bypass);

	config = proxy_config(proxies, parse_w32_proxy_override(bypass));
	return true;
}
#endif

}
