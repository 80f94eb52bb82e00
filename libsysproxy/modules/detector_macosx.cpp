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

#include <stdint.h>
#include <sstream>
#include <vector>

#include <SystemConfiguration/SystemConfiguration.h>

#include "../misc.hpp"
#include "../modules.hpp"

namespace libsysproxy {

static const char *SCHEMES[] = {
	"HTTP",
	"HTTPS",
	"FTP",
	NULL
};

class str : public string {
public:
	str(CFStringRef s) : string() {
		if (!s) return;
		const char* tmp = CFStringGetCStringPtr(s, kCFStringEncodingUTF8);
		if (tmp) {
			*this += tmp;
			return;
		}

		CFIndex size = CFStringGetMaximumSizeForEncoding(CFStringGetLength(s), kCFStringEncodingUTF8) + 1;
		vector<char> buffer(size);
		if (CFStringGetCString(s, &buffer[0], size, kCFStringEncodingUTF8))
			*this += &buffer[0];
	}
};

class cfdict {
public:
	cfdict(CFDictionaryRef dict) : dict(dict) {}
	~cfdict() { if (this->dict) CFRelease(this->dict); }

	CFDictionaryRef get() const { return this->dict; }

private:
	cfdict(const cfdict&);
	cfdict& operator=(const cfdict&);

	CFDictionaryRef dict;
};

template <class T>
static T getobj(CFDictionaryRef settings, string key) {
	if (!settings) return NULL;
	CFStringRef k = CFStringCreateWithCString(NULL, key.c_str(), kCFStringEncodingMacRoman);
	if (!k) return NULL;
	T retval = (T) CFDictionaryGetValue(settings, k);
	CFRelease(k);
	return retval;
}

static bool getint(CFDictionaryRef settings, string key, int64_t& answer) {
	CFNumberRef n = getobj<CFNumberRef>(settings, key);
	if (!n || CFGetTypeID(n) != CFNumberGetTypeID()) return false;
	if (!CFNumberGetValue(n, kCFNumberSInt64Type, &answer))
		return false;
	return true;
}

static bool getbool(CFDictionaryRef settings, string key, bool dflt=false) {
	int64_t i;
	if (!getint(settings, key, i)) return dflt;
	return i != 0;
}

static vector<string> getlist(CFDictionaryRef settings, string key) {
	vector<string> retval;
	CFArrayRef a = getobj<CFArrayRef>(settings, key);
	if (!a || CFGetTypeID(a) != CFArrayGetTypeID()) return retval;

	for (CFIndex i=0 ; i < CFArrayGetCount(a) ; i++) {
		CFStringRef s = (CFStringRef) CFArrayGetValueAtIndex(a, i);
		if (s && CFGetTypeID(s) == CFStringGetTypeID())
			retval.push_back(str(s));
	}
	return retval;
}

// <Protocol>Proxy[:<Protocol>Port], if <Protocol>Enable is set
static bool protocol_address(CFDictionaryRef settings, string protocol, string& address) {
	int64_t port;
	string  host;

	if (!getbool(settings, protocol + "Enable"))
		return false;

	if ((host = trim(str(getobj<CFStringRef>(settings, protocol + "Proxy")))) == "")
		return false;

	stringstream ss;
	ss << host;
	if (getint(settings, protocol + "Port", port) && port > 0)
		ss << ":" << port;

	address = ss.str();
	return true;
}

bool parse_macosx_proxies(CFDictionaryRef settings, proxy_config& config) {
	proxy_config::proxy_map addresses;
	for (int i=0 ; SCHEMES[i] ; i++) {
		string address;
		if (protocol_address(settings, SCHEMES[i], address))
			addresses[lowercase(SCHEMES[i])] = address;
	}

	if (addresses.empty())
		return false;

	config = proxy_config(addresses,
	                      getlist(settings, "ExceptionsList"),
	                      getbool(settings, "ExcludeSimpleHostnames"));
	return true;
}

bool macosx_detector::get_proxy_config(proxy_config& config) {
	cfdict proxies(SCDynamicStoreCopyProxies(NULL));
	if (!proxies.get())
		throw detection_error("Unable to fetch proxy configuration");

	return parse_macosx_proxies(proxies.get(), config);
}

}
