/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/config.hpp"
#include "dhtscan/error_code.hpp"

#include <string>

namespace dhtscan {

	struct dhtscan_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* dhtscan_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "dhtscan";
	}

	std::string dhtscan_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"invalid info-hash, expected 40 hexadecimal characters",
			"invalid type requested from entry",
			"KRPC message is not a dictionary",
			"KRPC message is missing a required field",
			"KRPC message has an invalid field",
			"unknown KRPC message type",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	boost::system::error_category& dhtscan_category()
	{
		static dhtscan_error_category dhtscan_category;
		return dhtscan_category;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, dhtscan_category()};
		}
	}
}
