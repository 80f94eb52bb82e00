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

#ifndef DETECTOR_HPP_
#define DETECTOR_HPP_

#include <string>
#include <vector>

#include "errors.hpp"
#include "proxy_config.hpp"

#define SPX_DETECTOR_ID(name) virtual string get_id() const { return name; }

namespace libsysproxy {

using namespace std;

// Detector: consults one configuration source of the operating system
class DLL_PUBLIC detector {
public:
	virtual ~detector();

	// Abstract methods
	virtual string get_id() const=0;

	/**
	 * Reads the proxy configuration of this source.
	 * @config Set to the configuration found, untouched otherwise
	 * @return true if the source configures a proxy, false if it has none
	 * @throws detection_error if the source could not be consulted or its
	 *         content is malformed
	 */
	virtual bool get_proxy_config(proxy_config& config)=0;
};

/**
 * Ordered set of detectors, consulted in priority order until one of them
 * finds a configuration. The set is fixed at construction.
 */
class DLL_PUBLIC detector_registry {
public:
	// The detectors built for this platform, in their default order
	detector_registry();

	// Uses the given detectors in the given order and takes ownership of them
	explicit detector_registry(const vector<detector*>& detectors);

	~detector_registry();

	const vector<detector*>& get_detectors() const;

	/**
	 * Runs the detectors in order and stops at the first one that finds a
	 * configuration. Detectors that fail are skipped.
	 * @config Set to the winning detector's configuration
	 * @return false if no detector found a configuration
	 */
	bool detect(proxy_config& config) const;

private:
	detector_registry(const detector_registry&);
	detector_registry& operator=(const detector_registry&);

	vector<detector*> detectors;
};

// Detects the proxy configuration using the default detectors
DLL_PUBLIC bool detect_proxy_config(proxy_config& config);

}

#endif /* DETECTOR_HPP_ */
