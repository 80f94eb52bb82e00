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

#include <cstdio>   // For remove()
#include <cstdlib>  // For mkstemp()
#include <fstream>
#include <string>

#include <unistd.h> // For close()

#include "../modules.hpp"
#include "test.hpp"

using namespace libsysproxy;

// Temporary file holding the given contents, removed on destruction
class tempfile {
public:
	tempfile(const string& contents) {
		char tmpl[] = "/tmp/sysproxy-test-XXXXXX";
		int fd = mkstemp(tmpl);
		if (fd >= 0) close(fd);
		this->filename = tmpl;

		ofstream file(this->filename.c_str());
		file << contents;
	}
	~tempfile() { remove(this->filename.c_str()); }

	const string& path() const { return this->filename; }

private:
	string filename;
};

enum result { FOUND, NOT_FOUND, FAILED };

static result detect(const string& contents, proxy_config& config) {
	tempfile file(contents);
	sysconfig_detector detector(file.path());
	try {
		return detector.get_proxy_config(config) ? FOUND : NOT_FOUND;
	}
	catch (detection_error&) {
		return FAILED;
	}
}

static bool test_enabled() {
	bool rtv = true;
	proxy_config config;
	string address;

	rtv = check(detect(
		"PROXY_ENABLED=\"yes\"\n"
		"HTTP_PROXY=\"proxy.local:3128\"\n"
		"NO_PROXY=\"localhost, .internal\"\n", config) == FOUND) && rtv;

	rtv = check(config.get_proxies().size() == 1) && rtv;
	rtv = check(config.get_proxy("http", address) && address == "proxy.local:3128") && rtv;
	rtv = check(config.get_bypass().size() == 2) && rtv;
	if (config.get_bypass().size() == 2) {
		rtv = check_equal(config.get_bypass()[0], "localhost") && rtv;
		rtv = check_equal(config.get_bypass()[1], ".internal") && rtv;
	}

	rtv = check(!select(config, "http://intra.internal/", address)) && rtv;
	rtv = check(select(config, "http://example.com/", address)) && rtv;
	rtv = check_equal(address, "proxy.local:3128") && rtv;
	rtv = check(!select(config, "ftp://example.com/", address)) && rtv;

	return rtv;
}

static bool test_all_schemes() {
	bool rtv = true;
	proxy_config config;
	string address;

	rtv = check(detect(
		"## Type:\tyesno\n"
		"## Default:\tno\n"
		"PROXY_ENABLED=\"yes\"\n"
		"\n"
		"HTTP_PROXY=\"http://192.168.0.1\"\n"
		"HTTPS_PROXY=\"http://192.168.0.1:8000\"\n"
		"FTP_PROXY=\"http://192.168.0.1\"\n"
		"GOPHER_PROXY=\"ignored\"\n"
		"NO_PROXY=\"localhost, 127.0.0.1\"\n", config) == FOUND) && rtv;

	rtv = check(config.get_proxies().size() == 3) && rtv;
	rtv = check(config.get_proxy("https", address) && address == "http://192.168.0.1:8000") && rtv;
	rtv = check(config.get_proxy("ftp", address) && address == "http://192.168.0.1") && rtv;

	// Empty values are skipped
	rtv = check(detect(
		"PROXY_ENABLED=\"yes\"\n"
		"HTTP_PROXY=\"\"\n"
		"HTTPS_PROXY=\"secure:443\"\n", config) == FOUND) && rtv;
	rtv = check(config.get_proxies().size() == 1) && rtv;
	rtv = check(config.get_proxy("https", address) && address == "secure:443") && rtv;

	return rtv;
}

static bool test_disabled() {
	bool rtv = true;
	proxy_config config;

	// Everything else in the file is discarded
	rtv = check(detect(
		"HTTP_PROXY=\"http://1.2.3.4\"\n"
		"PROXY_ENABLED=\"no\"\n", config) == NOT_FOUND) && rtv;
	rtv = check(config.get_proxies().empty()) && rtv;

	rtv = check(detect(
		"PROXY_ENABLED=\"maybe\"\n"
		"HTTP_PROXY=\"http://1.2.3.4\"\n", config) == NOT_FOUND) && rtv;

	// No file at all
	sysconfig_detector missing("/nonexistent/libsysproxy/proxy");
	rtv = check(!missing.get_proxy_config(config)) && rtv;

	return rtv;
}

static bool test_malformed() {
	bool rtv = true;
	proxy_config config;

	// Missing PROXY_ENABLED
	rtv = check(detect(
		"HTTP_PROXY=\"http://1.2.3.4\"\n"
		"HTTPS_PROXY=\"https://1.2.3.4:8000\"\n", config) == FAILED) && rtv;

	// Unquoted value
	rtv = check(detect(
		"PROXY_ENABLED=\"yes\"\n"
		"HTTP_PROXY=http://localhost\n", config) == FAILED) && rtv;

	return rtv;
}

int main()
{
	bool rtv = true;

	rtv = test_enabled() && rtv;
	rtv = test_all_schemes() && rtv;
	rtv = test_disabled() && rtv;
	rtv = test_malformed() && rtv;

	sysconfig_detector detector;
	rtv = check_equal(detector.get_id(), "sysconfig") && rtv;

	return !rtv;
}
