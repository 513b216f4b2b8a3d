/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/socket_io.hpp"

#include <cstdlib> // for strtol

namespace dhtscan {

	std::string print_address(address const& addr)
	{
		return addr.to_string();
	}

	std::string print_endpoint(address const& addr, int const port)
	{
		std::string ret;
		if (addr.is_v6())
		{
			ret += '[';
			ret += addr.to_string();
			ret += ']';
		}
		else
		{
			ret += addr.to_string();
		}
		ret += ':';
		ret += std::to_string(port);
		return ret;
	}

	std::string print_endpoint(tcp::endpoint const& ep)
	{
		return print_endpoint(ep.address(), ep.port());
	}

	std::string print_endpoint(udp::endpoint const& ep)
	{
		return print_endpoint(ep.address(), ep.port());
	}

	udp::endpoint parse_endpoint(std::string const& str, error_code& ec)
	{
		ec.clear();
		std::string::size_type const colon = str.rfind(':');
		if (colon == std::string::npos || colon + 1 == str.size())
		{
			ec = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
			return {};
		}

		address const addr = make_address(str.substr(0, colon), ec);
		if (ec) return {};

		char* end = nullptr;
		long const port = std::strtol(str.c_str() + colon + 1, &end, 10);
		if (*end != '\0' || port < 0 || port > 65535)
		{
			ec = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
			return {};
		}
		return udp::endpoint(addr, std::uint16_t(port));
	}
}
