/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_ASSERT_HPP_INCLUDED
#define DHTSCAN_ASSERT_HPP_INCLUDED

#include "dhtscan/config.hpp"

#if DHTSCAN_USE_ASSERTS

namespace dhtscan {

[[noreturn]] DHTSCAN_EXTRA_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function);

}

#define DHTSCAN_ASSERT(x) \
	do { if (x) {} else ::dhtscan::assert_fail(#x, __LINE__, __FILE__, __func__); } while (false)

#else

#define DHTSCAN_ASSERT(a) do {} while (false)

#endif

#endif // DHTSCAN_ASSERT_HPP_INCLUDED
