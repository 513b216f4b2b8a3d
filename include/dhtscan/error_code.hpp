/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_ERROR_CODE_HPP_INCLUDED
#define DHTSCAN_ERROR_CODE_HPP_INCLUDED

#include "dhtscan/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace dhtscan {

	namespace errors {

		// the error codes produced by dhtscan itself. They belong to the
		// category returned by dhtscan_category().
		enum error_code_enum
		{
			// Not an error
			no_error = 0,
			// an info-hash was not 40 hexadecimal characters
			invalid_info_hash,
			// an entry was accessed as a type it does not hold
			invalid_entry_type,
			// a KRPC message was not a bencoded dictionary
			krpc_not_a_dictionary,
			// a KRPC message lacked a required key
			krpc_missing_field,
			// a KRPC message had a key of the wrong type or size
			krpc_invalid_field,
			// the "y" key of a KRPC message was not "q", "r" or "e"
			krpc_unknown_message_type,

			// the number of error codes
			error_code_max
		};

		// hidden
		DHTSCAN_EXPORT boost::system::error_code make_error_code(error_code_enum e);

	} // namespace errors

	// return the instance of the dhtscan_error_category which
	// maps dhtscan error codes to human readable error messages.
	DHTSCAN_EXPORT boost::system::error_category& dhtscan_category();

	using error_code = boost::system::error_code;
	using system_error = boost::system::system_error;
	using boost::system::error_category;
	using boost::system::generic_category;
	using boost::system::system_category;
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<dhtscan::errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif // DHTSCAN_ERROR_CODE_HPP_INCLUDED
