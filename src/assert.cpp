/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/config.hpp"
#include "dhtscan/assert.hpp"

#if DHTSCAN_USE_ASSERTS

#include <cstdio>
#include <cstdlib>

namespace dhtscan {

[[noreturn]] void assert_fail(char const* expr, int const line
	, char const* file, char const* function)
{
	std::fprintf(stderr, "assertion failed. Please file a bug report\n\n"
		"file: '%s'\n"
		"line: %d\n"
		"function: %s\n"
		"expression: %s\n", file, line, function, expr);
	std::fflush(stderr);
	std::abort();
}

}

#endif
