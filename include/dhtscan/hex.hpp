/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_HEX_HPP_INCLUDED
#define DHTSCAN_HEX_HPP_INCLUDED

#include <string>

#include "dhtscan/config.hpp"
#include "dhtscan/span.hpp"

namespace dhtscan {
namespace aux {

	// returns the value of a single hex digit, or -1 if ``in`` is not one
	DHTSCAN_EXTRA_EXPORT int hex_to_int(char in);

	DHTSCAN_EXTRA_EXPORT bool is_hex(span<char const> in);

	// The overload taking a ``std::string`` converts (binary) the string ``s``
	// to hexadecimal representation and returns it.
	// The overload taking a ``char const*`` and a length converts the binary
	// buffer [``in``, ``in`` + len) to hexadecimal and prints it to the buffer
	// ``out``. The caller is responsible for making sure the buffer pointed to
	// by ``out`` is large enough, i.e. has at least len * 2 bytes of space.
	DHTSCAN_EXTRA_EXPORT std::string to_hex(span<char const> in);
	DHTSCAN_EXTRA_EXPORT void to_hex(span<char const> in, char* out);

	// converts the buffer [``in``, ``in`` + len) from hexadecimal to
	// binary. The binary output is written to the buffer pointed to
	// by ``out``. The caller is responsible for making sure the buffer
	// at ``out`` has enough space for the result to be written to, i.e.
	// (len + 1) / 2 bytes.
	DHTSCAN_EXTRA_EXPORT bool from_hex(span<char const> in, char* out);
}
}

#endif // DHTSCAN_HEX_HPP_INCLUDED
