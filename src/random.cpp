/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/random.hpp"

#include <algorithm>

namespace dhtscan {
namespace aux {

	std::mt19937& random_engine()
	{
		thread_local static std::mt19937 rng(std::random_device{}());
		return rng;
	}

	void random_bytes(span<char> buffer)
	{
		std::uniform_int_distribution<int> d(0, 255);
		std::generate(buffer.begin(), buffer.end()
			, [&] { return char(d(random_engine())); });
	}
}

	std::uint32_t random(std::uint32_t const max)
	{
		return std::uniform_int_distribution<std::uint32_t>(0, max)(aux::random_engine());
	}
}
