/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_VERSION_HPP_INCLUDED
#define DHTSCAN_VERSION_HPP_INCLUDED

#include "dhtscan/config.hpp"

#define DHTSCAN_VERSION_MAJOR 1
#define DHTSCAN_VERSION_MINOR 0
#define DHTSCAN_VERSION_TINY 0

// the format of this version is: MMmmtt
// M = Major version, m = minor version, t = tiny version
#define DHTSCAN_VERSION_NUM ((DHTSCAN_VERSION_MAJOR * 10000) + (DHTSCAN_VERSION_MINOR * 100) + DHTSCAN_VERSION_TINY)

#define DHTSCAN_VERSION "1.0.0"

namespace dhtscan {

	// the major, minor and tiny versions of dhtscan
	constexpr int version_major = 1;
	constexpr int version_minor = 0;
	constexpr int version_tiny = 0;

	// the dhtscan version in string form
	constexpr char const* version_str = "1.0.0";

	// returns the dhtscan version as string form in this format:
	// "<major>.<minor>.<tiny>"
	DHTSCAN_EXPORT char const* version();

}

#endif
