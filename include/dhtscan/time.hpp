/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_TIME_HPP_INCLUDED
#define DHTSCAN_TIME_HPP_INCLUDED

#include "dhtscan/config.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace dhtscan {

	// the monotonic clock used for all timeouts and deadlines
	using clock_type = std::chrono::steady_clock;

	using time_point = clock_type::time_point;
	using time_duration = clock_type::duration;

	using seconds = std::chrono::seconds;
	using milliseconds = std::chrono::milliseconds;
	using microseconds = std::chrono::microseconds;
	using minutes = std::chrono::minutes;

	using std::chrono::duration_cast;

	constexpr time_point min_time() { return (time_point::min)(); }
	constexpr time_point max_time() { return (time_point::max)(); }

	template <class T>
	std::int64_t total_seconds(T td)
	{ return duration_cast<seconds>(td).count(); }

	template <class T>
	std::int64_t total_milliseconds(T td)
	{ return duration_cast<milliseconds>(td).count(); }

	template <class T>
	std::int64_t total_microseconds(T td)
	{ return duration_cast<microseconds>(td).count(); }

	// formats ``t`` in local time as ``YYYY-MM-DDTHH:MM:SS.ffffff``. The
	// fractional part is left out when the microseconds are zero.
	DHTSCAN_EXPORT std::string iso8601_time(std::chrono::system_clock::time_point t);
}

#endif // DHTSCAN_TIME_HPP_INCLUDED
