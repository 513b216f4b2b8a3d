/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/sha1_hash.hpp"
#include "dhtscan/hex.hpp"

#if DHTSCAN_USE_IOSTREAM
#include <iostream>
#endif

namespace dhtscan {

	int sha1_hash::count_leading_zeroes() const noexcept
	{
		int ret = 0;
		for (auto const v : m_number)
		{
			if (v == 0)
			{
				ret += 8;
				continue;
			}
			for (int bit = 7; bit >= 0; --bit)
			{
				if (v & (1 << bit)) return ret;
				++ret;
			}
		}
		return ret;
	}

	bool parse_info_hash(span<char const> hex, sha1_hash& h)
	{
		if (hex.size() != sha1_hash::size() * 2) return false;
		sha1_hash tmp;
		if (!aux::from_hex(hex, tmp.data())) return false;
		h = tmp;
		return true;
	}

#if DHTSCAN_USE_IOSTREAM

	std::ostream& operator<<(std::ostream& os, sha1_hash const& peer)
	{
		char out[sha1_hash::size() * 2 + 1];
		aux::to_hex(peer, out);
		out[sha1_hash::size() * 2] = '\0';
		return os << out;
	}

	std::istream& operator>>(std::istream& is, sha1_hash& peer)
	{
		char hex[sha1_hash::size() * 2];
		is.read(hex, sha1_hash::size() * 2);
		if (is.fail()) return is;
		if (!parse_info_hash(hex, peer))
			is.setstate(std::ios_base::failbit);
		return is;
	}

#endif // DHTSCAN_USE_IOSTREAM
}
