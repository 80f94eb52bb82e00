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

#ifndef CONFIG_HPP_
#define CONFIG_HPP_

#ifdef _WIN32
#pragma warning(disable: 4251)
#pragma warning(disable: 4275)
#ifdef SPX_BUILDING
#define DLL_PUBLIC __declspec(dllexport)
#else
#define DLL_PUBLIC __declspec(dllimport)
#endif
#ifndef _WIN32_WINNT
#define _WIN32_WINNT 0x0501
#endif
#include <windows.h>
#else
#define DLL_PUBLIC __attribute__ ((visibility("default")))
#endif

#ifndef SYSCONFIG_PROXY_FILE
#define SYSCONFIG_PROXY_FILE "/etc/sysconfig/proxy"
#endif

#endif /* CONFIG_HPP_ */
