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

#include <cstdlib>  // For getenv()
#include <iostream> // For cerr

#include "detector.hpp"
#include "modules.hpp"

namespace libsysproxy {

detector::~detector() {}

detector_registry::detector_registry() {
#ifdef SPX_WITH_ENVVAR
	this->detectors.push_back(new envvar_detector());
#endif
#ifdef SPX_WITH_SYSCONFIG
	// Environment variables take precedence over /etc/sysconfig/proxy
	this->detectors.push_back(new sysconfig_detector());
#endif
#ifdef _WIN32
	this->detectors.push_back(new w32reg_detector());
#endif
#ifdef __APPLE__
	this->detectors.push_back(new macosx_detector());
#endif
}

detector_registry::detector_registry(const vector<detector*>& detectors)
	: detectors(detectors) {}

detector_registry::~detector_registry() {
	for (vector<detector*>::iterator i=this->detectors.begin() ; i != this->detectors.end() ; i++)
		delete *i;
}

const vector<detector*>& detector_registry::get_detectors() const {
	return this->detectors;
}

bool detector_registry::detect(proxy_config& config) const {
	const char* debug = getenv("_SPX_DEBUG");

	for (vector<detector*>::const_iterator i=this->detectors.begin() ; i != this->detectors.end() ; i++) {
		try {
			if ((*i)->get_proxy_config(config)) {
				if (debug) cerr << "Using config: " << (*i)->get_id() << endl;
				return true;
			}
			if (debug) cerr << "No proxy configured in: " << (*i)->get_id() << endl;
		}
		catch (exception& e) {
			if (debug) cerr << "Detection failed in " << (*i)->get_id() << ": " << e.what() << endl;
		}
	}

	if (debug) cerr << "No proxy configuration found" << endl;
	return false;
}

bool detect_proxy_config(proxy_config& config) {
	detector_registry registry;
	return registry.detect(config);
}

}
