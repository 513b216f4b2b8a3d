/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/hex.hpp"

#include <cstdint>

namespace dhtscan {
namespace aux {

	int hex_to_int(char in)
	{
		if (in >= '0' && in <= '9') return int(in) - '0';
		if (in >= 'A' && in <= 'F') return int(in) - 'A' + 10;
		if (in >= 'a' && in <= 'f') return int(in) - 'a' + 10;
		return -1;
	}

	bool is_hex(span<char const> in)
	{
		for (char const c : in)
		{
			int const t = hex_to_int(c);
			if (t == -1) return false;
		}
		return (in.size() % 2) == 0;
	}

	bool from_hex(span<char const> in, char* out)
	{
		for (auto i = in.begin(), end = in.end(); i != end; ++i, ++out)
		{
			int const t1 = hex_to_int(*i);
			if (t1 == -1) return false;
			*out = char(t1 << 4);
			++i;
			if (i == end) return false;
			int const t2 = hex_to_int(*i);
			if (t2 == -1) return false;
			*out |= char(t2 & 15);
		}
		return true;
	}

	extern char const hex_chars[];

	char const hex_chars[] = "0123456789abcdef";

	std::string to_hex(span<char const> in)
	{
		std::string ret;
		if (!in.empty())
		{
			ret.resize(std::size_t(in.size() * 2));
			to_hex(in, &ret[0]);
		}
		return ret;
	}

	void to_hex(span<char const> in, char* out)
	{
		for (char const c : in)
		{
			*out++ = hex_chars[std::uint8_t(c) >> 4];
			*out++ = hex_chars[std::uint8_t(c) & 0xf];
		}
	}
}
}
