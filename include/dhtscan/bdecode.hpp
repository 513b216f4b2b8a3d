/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_BDECODE_HPP_INCLUDED
#define DHTSCAN_BDECODE_HPP_INCLUDED

#include "dhtscan/config.hpp"
#include "dhtscan/entry.hpp"
#include "dhtscan/error_code.hpp"
#include "dhtscan/span.hpp"

namespace dhtscan {

namespace bdecode_errors
{
	// the errors bdecode() reports
	enum error_code_enum
	{
		// Not an error
		no_error = 0,
		// expected digit in bencoded string
		expected_digit,
		// expected colon in bencoded string
		expected_colon,
		// unexpected end of file in bencoded string
		unexpected_eof,
		// expected value (list, dict, int or string) in bencoded string
		expected_value,
		// bencoded recursion depth limit exceeded
		depth_exceeded,
		// bencoded item count limit exceeded
		limit_exceeded,
		// integer overflow
		overflow,

		// the number of error codes
		error_code_max
	};

	// hidden
	DHTSCAN_EXPORT boost::system::error_code make_error_code(error_code_enum e);
}

	DHTSCAN_EXPORT boost::system::error_category& bdecode_category();

	// This function decodes bencoded data into an entry.
	//
	// If the buffer is not valid bencoding, ``ec`` is set, ``error_pos``
	// (if not nullptr) receives the offset where the error was detected and an
	// undefined entry is returned. Any data following the first complete
	// item is ignored.
	//
	// ``depth_limit`` sets the maximum nesting of lists and dictionaries and
	// ``token_limit`` the maximum number of items (strings, integers, lists,
	// dictionaries) the buffer may contain. Both limit the amount of work an
	// adversarial datagram can cause.
	DHTSCAN_EXPORT entry bdecode(span<char const> buffer
		, error_code& ec, int* error_pos = nullptr, int depth_limit = 100
		, int token_limit = 2000);

	// throws system_error on failure
	DHTSCAN_EXPORT entry bdecode(span<char const> buffer
		, int depth_limit = 100, int token_limit = 2000);
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<dhtscan::bdecode_errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif // DHTSCAN_BDECODE_HPP_INCLUDED
