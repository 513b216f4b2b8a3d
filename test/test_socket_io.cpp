/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <iterator>
#include <string>

#include "test.hpp"
#include "dhtscan/socket_io.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/io.hpp"

using namespace dhtscan;
using namespace dhtscan::detail;

namespace {

udp::endpoint uep(char const* ip, int port)
{
	return udp::endpoint(make_address(ip), std::uint16_t(port));
}

} // anonymous namespace

DHTSCAN_TEST(read_write_integers)
{
	std::string buf;
	auto out = std::back_inserter(buf);
	write_uint16(0x1f90, out);
	write_uint32(0x0a0b0c0d, out);
	TEST_EQUAL(buf, std::string("\x1f\x90\x0a\x0b\x0c\x0d", 6));

	char const* in = buf.data();
	TEST_EQUAL(read_uint16(in), 0x1f90);
	TEST_EQUAL(read_uint32(in), 0x0a0b0c0du);
	TEST_CHECK(in == buf.data() + buf.size());
}

DHTSCAN_TEST(read_v4_address)
{
	std::string buf;
	write_address(make_address("16.5.128.1"), std::back_inserter(buf));
	TEST_EQUAL(buf, "\x10\x05\x80\x01");
	address const addr = read_v4_address(buf.begin());
	TEST_EQUAL(addr, make_address("16.5.128.1"));

	buf.clear();
	write_endpoint(uep("16.5.128.1", 1337), std::back_inserter(buf));
	TEST_EQUAL(buf, "\x10\x05\x80\x01\x05\x39");
	udp::endpoint const ep4 = read_v4_endpoint<udp::endpoint>(buf.begin());
	TEST_EQUAL(ep4, uep("16.5.128.1", 1337));
}

DHTSCAN_TEST(print_endpoint)
{
	TEST_EQUAL(print_endpoint(uep("10.0.0.1", 6881)), "10.0.0.1:6881");
	TEST_EQUAL(print_endpoint(tcp::endpoint(make_address("1.2.3.4"), 80)), "1.2.3.4:80");
	TEST_EQUAL(print_address(make_address("127.0.0.1")), "127.0.0.1");
}

DHTSCAN_TEST(parse_endpoint)
{
	error_code ec;
	udp::endpoint ep = parse_endpoint("127.0.0.1:6881", ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(ep, uep("127.0.0.1", 6881));

	ep = parse_endpoint("", ec);
	TEST_CHECK(ec);
	ec.clear();

	ep = parse_endpoint("127.0.0.1", ec);
	TEST_CHECK(ec);
	ec.clear();

	ep = parse_endpoint("127.0.0.1:", ec);
	TEST_CHECK(ec);
	ec.clear();

	ep = parse_endpoint("127.0.0.1:-4", ec);
	TEST_CHECK(ec);
	ec.clear();

	ep = parse_endpoint("127.0.0.1:65536", ec);
	TEST_CHECK(ec);
	ec.clear();

	ep = parse_endpoint("127.0.0.1:12a", ec);
	TEST_CHECK(ec);
	ec.clear();

	// host names are not resolved
	ep = parse_endpoint("router.bittorrent.com:6881", ec);
	TEST_CHECK(ec);
}
