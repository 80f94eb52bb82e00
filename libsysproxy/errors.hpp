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

#ifndef ERRORS_HPP_
#define ERRORS_HPP_

#include <stdexcept>
#include <string>

#include "config.hpp"

namespace libsysproxy {

using namespace std;

// A source could not be consulted (I/O, permission, API unavailable)
class DLL_PUBLIC detection_error : public runtime_error {
public:
	detection_error(const string& __arg): runtime_error(__arg) {}
};

// A source was reachable but its content was malformed
class DLL_PUBLIC parse_error : public detection_error {
public:
	parse_error(const string& __arg): detection_error(__arg) {}
};

}

#endif /* ERRORS_HPP_ */
