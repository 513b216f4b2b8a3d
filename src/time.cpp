/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/time.hpp"

#include <cstdio> // for snprintf
#include <ctime>

namespace dhtscan {

	std::string iso8601_time(std::chrono::system_clock::time_point const t)
	{
		using std::chrono::system_clock;

		// round towards the beginning of time, also for times before the epoch
		auto const since_epoch = duration_cast<microseconds>(t.time_since_epoch());
		auto whole = duration_cast<seconds>(since_epoch);
		if (whole > since_epoch) whole -= seconds(1);
		int const micros = int((since_epoch - whole).count());

		std::time_t const tt = std::time_t(whole.count());
		std::tm tm{};
#ifdef _WIN32
		localtime_s(&tm, &tt);
#else
		localtime_r(&tt, &tm);
#endif

		char buf[64];
		int len = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d"
			, tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday
			, tm.tm_hour, tm.tm_min, tm.tm_sec);
		if (micros != 0)
			len += std::snprintf(buf + len, sizeof(buf) - std::size_t(len), ".%06d", micros);
		return std::string(buf, std::size_t(len));
	}
}
