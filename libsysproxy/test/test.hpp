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

#ifndef TEST_HPP_
#define TEST_HPP_

#include <iostream>
#include <string>

// Usage: rtv = check(expression) && rtv;
#define check(expr) _check((expr), #expr, __FILE__, __LINE__)
static inline bool _check(bool ok, const char* expr, const char* file, int line) {
	if (!ok)
		std::cerr << "Check failed: " << expr
		          << " (" << file << ":" << line << ")"
		          << std::endl;
	return ok;
}

#define check_equal(a, b) _check_equal((a), (b), #a, __FILE__, __LINE__)
static inline bool _check_equal(const std::string& value, const std::string& expected,
                                const char* expr, const char* file, int line) {
	if (value != expected)
		std::cerr << "Check failed: " << expr << " is '" << value
		          << "', expected '" << expected << "'"
		          << " (" << file << ":" << line << ")"
		          << std::endl;
	return value == expected;
}

#endif /* TEST_HPP_ */
