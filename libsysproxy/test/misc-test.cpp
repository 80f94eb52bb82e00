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

#include <string>
#include <vector>

#include "../misc.hpp"
#include "test.hpp"

using namespace libsysproxy;

int main()
{
	bool rtv = true;

	rtv = check_equal(trim("  a b \t\r\n"), "a b") && rtv;
	rtv = check_equal(trim(" \t "), "") && rtv;
	rtv = check_equal(trim("[section]", "[]"), "section") && rtv;

	rtv = check_equal(lowercase("Example.COM"), "example.com") && rtv;
	rtv = check_equal(uppercase("https"), "HTTPS") && rtv;

	vector<string> tokens = split("localhost, .internal;;  10.0.0.1 ,", ",;");
	rtv = check(tokens.size() == 3) && rtv;
	if (tokens.size() == 3) {
		rtv = check_equal(tokens[0], "localhost") && rtv;
		rtv = check_equal(tokens[1], ".internal") && rtv;
		rtv = check_equal(tokens[2], "10.0.0.1") && rtv;
	}
	rtv = check(split("", ",").empty()) && rtv;
	rtv = check(split(" , ,", ",").empty()) && rtv;
	rtv = check(split("single", ",").size() == 1) && rtv;

	rtv = check(ends_with("a.example.com", ".example.com")) && rtv;
	rtv = check(!ends_with("com", ".com")) && rtv;
	rtv = check(ends_with("anything", "")) && rtv;

	return !rtv;
}
