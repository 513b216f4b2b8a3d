/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_RANDOM_HPP_INCLUDED
#define DHTSCAN_RANDOM_HPP_INCLUDED

#include "dhtscan/config.hpp"
#include "dhtscan/span.hpp"

#include <cstdint>
#include <random>

namespace dhtscan {
namespace aux {

	// a per-thread pseudo random engine, seeded from std::random_device
	DHTSCAN_EXTRA_EXPORT std::mt19937& random_engine();

	// fills the buffer with pseudo random bytes
	DHTSCAN_EXTRA_EXPORT void random_bytes(span<char> buffer);
}

	// returns a uniformly distributed number in the range [0, max]
	DHTSCAN_EXTRA_EXPORT std::uint32_t random(std::uint32_t max);
}

#endif // DHTSCAN_RANDOM_HPP_INCLUDED
