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

#include <sstream>
#include <string>

#include "../config_file.hpp"
#include "test.hpp"

using namespace libsysproxy;

static bool _throws_parse_error(const string& contents) {
	config_file cf;
	istringstream stream(contents);
	try {
		cf.load(stream);
	}
	catch (parse_error&) {
		return true;
	}
	return false;
}

int main()
{
	bool rtv = true;
	string value;

	config_file cf;
	istringstream stream(
		"\n"
		"## Path:        Network/Proxy\n"
		"# comment\n"
		"foo=\"bar\"\n"
		"  baz=\"quux\"  \n"
		"\n"
		"spam=\"eggs\" trailing\n"
		"empty=\"\"\n"
		"unterminated=\"value\n");
	cf.load(stream);

	rtv = check(cf.get_value("foo", value)) && rtv;
	rtv = check_equal(value, "bar") && rtv;
	rtv = check(cf.get_value("baz", value)) && rtv;
	rtv = check_equal(value, "quux") && rtv;
	rtv = check(cf.get_value("spam", value)) && rtv;
	rtv = check_equal(value, "eggs") && rtv;
	rtv = check(cf.get_value("empty", value)) && rtv;
	rtv = check_equal(value, "") && rtv;
	rtv = check(cf.get_value("unterminated", value)) && rtv;
	rtv = check_equal(value, "value") && rtv;
	rtv = check(!cf.get_value("missing", value)) && rtv;

	// Every non-blank, non-comment line needs KEY="
	rtv = check(_throws_parse_error("foo=\"bar\"\nbaz \"quux\"\n")) && rtv;
	rtv = check(_throws_parse_error("HTTP_PROXY=http://localhost\n")) && rtv;
	rtv = check(_throws_parse_error("=\"value\"\n")) && rtv;
	rtv = check(!_throws_parse_error("# only a comment\n\n")) && rtv;

	// A missing file is not an error
	config_file missing;
	rtv = check(!missing.load("/nonexistent/libsysproxy/proxy")) && rtv;

	return !rtv;
}
