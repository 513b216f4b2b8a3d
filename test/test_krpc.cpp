/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <string>
#include <variant>
#include <vector>

#include "test.hpp"
#include "dhtscan/kademlia/msg.hpp"
#include "dhtscan/bdecode.hpp"
#include "dhtscan/socket_io.hpp"

using namespace dhtscan;
using namespace dhtscan::dht;

namespace {

std::string to_string(std::vector<char> const& v)
{
	return std::string(v.begin(), v.end());
}

error_code decode_error(std::string const& buf)
{
	message m;
	error_code ec;
	TEST_CHECK(!decode(buf, m, ec));
	return ec;
}

udp::endpoint uep(char const* ip, int port)
{
	return udp::endpoint(make_address(ip), std::uint16_t(port));
}

} // anonymous namespace

// the examples are the ones from the DHT protocol description (BEP 5)
DHTSCAN_TEST(encode_ping)
{
	query_message q;
	q.transaction_id = "aa";
	q.method = query_method::ping;
	q.sender = node_id("abcdefghij0123456789");

	TEST_EQUAL(to_string(encode(q))
		, "d1:ad2:id20:abcdefghij0123456789e1:q4:ping1:t2:aa1:y1:qe");
}

DHTSCAN_TEST(encode_find_node)
{
	query_message q;
	q.transaction_id = "aa";
	q.method = query_method::find_node;
	q.sender = node_id("abcdefghij0123456789");
	q.target = node_id("mnopqrstuvwxyz123456");

	TEST_EQUAL(to_string(encode(q))
		, "d1:ad2:id20:abcdefghij01234567896:target20:mnopqrstuvwxyz123456e"
		"1:q9:find_node1:t2:aa1:y1:qe");
}

DHTSCAN_TEST(encode_get_peers)
{
	query_message q;
	q.transaction_id = "aa";
	q.method = query_method::get_peers;
	q.sender = node_id("abcdefghij0123456789");
	q.target = node_id("mnopqrstuvwxyz123456");

	TEST_EQUAL(to_string(encode(q))
		, "d1:ad2:id20:abcdefghij01234567899:info_hash20:mnopqrstuvwxyz123456e"
		"1:q9:get_peers1:t2:aa1:y1:qe");
}

DHTSCAN_TEST(encode_error)
{
	error_message e;
	e.transaction_id = "aa";
	e.code = generic_error;
	e.message = "A Generic Error Ocurred";

	TEST_EQUAL(to_string(encode(e))
		, "d1:eli201e23:A Generic Error Ocurrede1:t2:aa1:y1:ee");
}

DHTSCAN_TEST(encode_response)
{
	response_message r;
	r.transaction_id = "aa";
	r.sender = node_id("mnopqrstuvwxyz123456");
	r.token = "aoeusnth";
	r.peers.push_back(tcp::endpoint(make_address("97.120.106.101"), 11893));
	r.peers.push_back(tcp::endpoint(make_address("105.100.104.116"), 28269));

	TEST_EQUAL(to_string(encode(r))
		, "d1:rd2:id20:mnopqrstuvwxyz1234565:token8:aoeusnth6:valuesl6:axje.u6:idhtnmee"
		"1:t2:aa1:y1:re");
}

DHTSCAN_TEST(decode_get_peers_values)
{
	std::string const buf = "d1:rd2:id20:abcdefghij01234567895:token8:aoeusnth"
		"6:valuesl6:axje.u6:idhtnm3:bade1:t2:aa1:y1:re";

	message m;
	error_code ec;
	TEST_CHECK(decode(buf, m, ec));
	TEST_CHECK(!ec);

	auto const* r = std::get_if<response_message>(&m);
	TEST_CHECK(r != nullptr);
	if (r == nullptr) return;

	TEST_EQUAL(r->transaction_id, "aa");
	TEST_CHECK(r->sender == node_id("abcdefghij0123456789"));
	TEST_EQUAL(r->token, "aoeusnth");
	TEST_CHECK(r->nodes.empty());

	// the 3 byte peer is skipped
	TEST_EQUAL(r->peers.size(), 2);
	TEST_EQUAL(r->peers[0], tcp::endpoint(make_address("97.120.106.101"), 11893));
	TEST_EQUAL(r->peers[1], tcp::endpoint(make_address("105.100.104.116"), 28269));
}

DHTSCAN_TEST(decode_nodes)
{
	std::vector<node_endpoint> nodes;
	nodes.emplace_back(node_id("aaaaaaaaaaaaaaaaaaaa"), uep("10.0.0.1", 6881));
	nodes.emplace_back(node_id("bbbbbbbbbbbbbbbbbbbb"), uep("192.168.1.2", 1));

	std::string const compact = write_nodes(nodes);
	TEST_EQUAL(compact.size(), 52);
	TEST_CHECK(compact.substr(20, 6) == std::string("\x0a\x00\x00\x01\x1a\xe1", 6));
	TEST_CHECK(read_nodes(compact) == nodes);

	// a trailing partial node is ignored
	TEST_CHECK(read_nodes(compact + "abc") == nodes);
	TEST_CHECK(read_nodes(compact.substr(0, 25)).empty());

	response_message r;
	r.transaction_id = "xy";
	r.sender = node_id("cccccccccccccccccccc");
	r.nodes = nodes;

	message m;
	error_code ec;
	TEST_CHECK(decode(encode(r), m, ec));
	auto const* rm = std::get_if<response_message>(&m);
	TEST_CHECK(rm != nullptr);
	if (rm == nullptr) return;
	TEST_CHECK(rm->nodes == nodes);
	TEST_CHECK(rm->peers.empty());
	TEST_CHECK(rm->token.empty());
}

DHTSCAN_TEST(decode_queries)
{
	message m;
	error_code ec;

	TEST_CHECK(decode(std::string("d1:ad2:id20:abcdefghij0123456789e1:q4:ping1:t2:aa1:y1:qe"), m, ec));
	auto const* q = std::get_if<query_message>(&m);
	TEST_CHECK(q != nullptr);
	if (q == nullptr) return;
	TEST_CHECK(q->method == query_method::ping);
	TEST_EQUAL(q->method_name, "ping");
	TEST_EQUAL(q->transaction_id, "aa");
	TEST_CHECK(q->sender == node_id("abcdefghij0123456789"));

	TEST_CHECK(decode(std::string("d1:ad2:id20:abcdefghij01234567899:info_hash20:mnopqrstuvwxyz123456e"
		"1:q9:get_peers1:t2:aa1:y1:qe"), m, ec));
	q = std::get_if<query_message>(&m);
	TEST_CHECK(q != nullptr);
	if (q == nullptr) return;
	TEST_CHECK(q->method == query_method::get_peers);
	TEST_CHECK(q->target == node_id("mnopqrstuvwxyz123456"));

	TEST_CHECK(decode(std::string("d1:ad2:id20:abcdefghij01234567899:info_hash20:mnopqrstuvwxyz123456"
		"4:porti6881e5:token8:aoeusnthe1:q13:announce_peer1:t2:aa1:y1:qe"), m, ec));
	q = std::get_if<query_message>(&m);
	TEST_CHECK(q != nullptr);
	if (q == nullptr) return;
	TEST_CHECK(q->method == query_method::announce_peer);
	TEST_EQUAL(q->port, 6881);
	TEST_EQUAL(q->token, "aoeusnth");
	TEST_CHECK(!q->implied_port);

	// methods we don't know still parse, so they can be answered
	TEST_CHECK(decode(std::string("d1:ad2:id20:abcdefghij0123456789e1:q9:vote_spam1:t2:zz1:y1:qe"), m, ec));
	q = std::get_if<query_message>(&m);
	TEST_CHECK(q != nullptr);
	if (q == nullptr) return;
	TEST_CHECK(q->method == query_method::unknown);
	TEST_EQUAL(q->method_name, "vote_spam");
	TEST_EQUAL(to_string(encode(*q))
		, "d1:ad2:id20:abcdefghij0123456789e1:q9:vote_spam1:t2:zz1:y1:qe");
}

DHTSCAN_TEST(decode_error_message)
{
	message m;
	error_code ec;
	TEST_CHECK(decode(std::string("d1:eli201e23:A Generic Error Ocurrede1:t2:aa1:y1:ee"), m, ec));
	auto const* e = std::get_if<error_message>(&m);
	TEST_CHECK(e != nullptr);
	if (e == nullptr) return;
	TEST_EQUAL(e->code, 201);
	TEST_EQUAL(e->message, "A Generic Error Ocurred");
	TEST_EQUAL(transaction_id(m), "aa");
}

DHTSCAN_TEST(invalid_messages)
{
	TEST_CHECK(decode_error("i5e") == errors::krpc_not_a_dictionary);
	TEST_CHECK(decode_error("d1:y1:qe") == errors::krpc_missing_field);
	TEST_CHECK(decode_error("d1:ti1e1:y1:qe") == errors::krpc_invalid_field);
	TEST_CHECK(decode_error("d1:t2:aa1:y1:xe") == errors::krpc_unknown_message_type);
	TEST_CHECK(decode_error("d1:t2:aa1:y2:qqe") == errors::krpc_invalid_field);

	// a query without arguments
	TEST_CHECK(decode_error("d1:q4:ping1:t2:aa1:y1:qe") == errors::krpc_missing_field);

	// a 19 byte node ID
	TEST_CHECK(decode_error("d1:ad2:id19:abcdefghij012345678e1:q4:ping1:t2:aa1:y1:qe")
		== errors::krpc_invalid_field);

	// find_node without a target
	TEST_CHECK(decode_error("d1:ad2:id20:abcdefghij0123456789e1:q9:find_node1:t2:aa1:y1:qe")
		== errors::krpc_missing_field);

	// get_peers with a short info-hash
	TEST_CHECK(decode_error("d1:ad2:id20:abcdefghij01234567899:info_hash3:abce"
		"1:q9:get_peers1:t2:aa1:y1:qe") == errors::krpc_invalid_field);

	// a response without a node ID
	TEST_CHECK(decode_error("d1:rd5:token1:xe1:t2:aa1:y1:re") == errors::krpc_missing_field);

	// an error without a message
	TEST_CHECK(decode_error("d1:eli201ee1:t2:aa1:y1:ee") == errors::krpc_invalid_field);

	// not bencoded at all
	TEST_CHECK(decode_error("hello") == bdecode_errors::expected_value);
}

DHTSCAN_TEST(verify_message)
{
	static key_desc_t const desc[] = {
		{"a", entry::string_t, 2, 0},
		{"b", entry::int_t, 0, key_desc_t::optional},
		{"c", entry::undefined_t, 0, 0},
	};

	entry const* ret[3];
	error_code ec;

	entry e = bdecode(std::string("d1:a2:xy1:b3:foo1:cle"));
	TEST_CHECK(verify_message(e, desc, ret, ec));
	TEST_CHECK(ret[0] != nullptr);
	// an optional key of the wrong type is treated as missing
	TEST_CHECK(ret[1] == nullptr);
	TEST_CHECK(ret[2] != nullptr);

	e = bdecode(std::string("d1:a3:xyz1:ci1ee"));
	TEST_CHECK(!verify_message(e, desc, ret, ec));
	TEST_CHECK(ec == errors::krpc_invalid_field);

	e = bdecode(std::string("d1:a2:xye"));
	TEST_CHECK(!verify_message(e, desc, ret, ec));
	TEST_CHECK(ec == errors::krpc_missing_field);
}
