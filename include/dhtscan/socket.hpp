/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_SOCKET_HPP_INCLUDED
#define DHTSCAN_SOCKET_HPP_INCLUDED

#include "dhtscan/config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

namespace dhtscan {

	using tcp = boost::asio::ip::tcp;
	using udp = boost::asio::ip::udp;

	using address = boost::asio::ip::address;
	using address_v4 = boost::asio::ip::address_v4;
	using boost::asio::ip::make_address;

	using io_context = boost::asio::io_context;
	using deadline_timer = boost::asio::steady_timer;
}

#endif // DHTSCAN_SOCKET_HPP_INCLUDED
