/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_SOCKET_IO_HPP_INCLUDED
#define DHTSCAN_SOCKET_IO_HPP_INCLUDED

#include <string>

#include "dhtscan/config.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/io.hpp"
#include "dhtscan/assert.hpp"
#include "dhtscan/error_code.hpp"

namespace dhtscan {

	DHTSCAN_EXTRA_EXPORT std::string print_address(address const& adr);
	DHTSCAN_EXTRA_EXPORT std::string print_endpoint(address const& addr, int port);
	DHTSCAN_EXTRA_EXPORT std::string print_endpoint(tcp::endpoint const& ep);
	DHTSCAN_EXTRA_EXPORT std::string print_endpoint(udp::endpoint const& ep);

	// parses "a.b.c.d:port". Host names are not resolved, on failure ``ec``
	// is set and a default constructed endpoint is returned
	DHTSCAN_EXTRA_EXPORT udp::endpoint parse_endpoint(std::string const& str
		, error_code& ec);

	namespace detail {

		// the size of an IPv4 address in the compact wire format
		constexpr int address_v4_size = 4;

		template<class OutIt>
		void write_address(address const& a, OutIt&& out)
		{
			DHTSCAN_ASSERT(a.is_v4());
			write_uint32(a.to_v4().to_uint(), out);
		}

		template<class InIt>
		address read_v4_address(InIt&& in)
		{
			std::uint32_t const ip = read_uint32(in);
			return address_v4(ip);
		}

		template<class Endpoint, class OutIt>
		void write_endpoint(Endpoint const& e, OutIt&& out)
		{
			write_address(e.address(), out);
			write_uint16(e.port(), out);
		}

		template<class Endpoint, class InIt>
		Endpoint read_v4_endpoint(InIt&& in)
		{
			address const addr = read_v4_address(in);
			std::uint16_t const port = read_uint16(in);
			return Endpoint(addr, port);
		}
	}
}

#endif // DHTSCAN_SOCKET_IO_HPP_INCLUDED
