/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <iterator>
#include <vector>

#include "test.hpp"
#include "dhtscan/kademlia/routing_table.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/kademlia/node_id.hpp"

using namespace dhtscan;
using namespace dhtscan::dht;

namespace {

// an ID whose first byte is ``prefix`` and last byte is ``n``. Our own ID is
// all zeros, so the prefix decides which bucket the node lands in
node_id make_id(std::uint8_t const prefix, std::uint8_t const n)
{
	node_id ret;
	ret[0] = prefix;
	ret[19] = n;
	return ret;
}

udp::endpoint ep(int const n, int const port = 6881)
{
	return udp::endpoint(address_v4(std::uint32_t(0x0a000000 + n)), std::uint16_t(port));
}

} // anonymous namespace

DHTSCAN_TEST(add_and_find)
{
	dht_settings sett;
	routing_table tbl(node_id(), sett.bucket_size, sett, nullptr);

	TEST_EQUAL(tbl.size(), 0);
	TEST_EQUAL(tbl.num_active_buckets(), 1);

	for (int i = 1; i <= 5; ++i)
		TEST_CHECK(tbl.node_seen(make_id(std::uint8_t(i << 4), 0), ep(i), 50));

	TEST_EQUAL(tbl.size(), 5);
	TEST_EQUAL(tbl.num_confirmed_nodes(), 5);

	// sorted by distance to the target
	node_id const target = make_id(0x30, 0);
	std::vector<node_entry> const nodes = tbl.find_node(target, {}, 3);
	TEST_EQUAL(nodes.size(), 3);
	TEST_CHECK(nodes[0].id == make_id(0x30, 0));
	TEST_CHECK(nodes[1].id == make_id(0x20, 0));
	TEST_CHECK(nodes[2].id == make_id(0x10, 0));
	TEST_EQUAL(nodes[0].ep(), ep(3));

	// a count of 0 means the bucket size
	TEST_EQUAL(tbl.find_node(target, {}).size(), 5);

	TEST_CHECK(tbl.find_node(make_id(0x20, 0)) != nullptr);
	TEST_CHECK(tbl.find_node(make_id(0x20, 1)) == nullptr);

	int count = 0;
	tbl.for_each_node([&count](node_entry const&) { ++count; });
	TEST_EQUAL(count, 5);
}

DHTSCAN_TEST(ignore_self_and_routers)
{
	dht_settings sett;
	node_id const self = make_id(0x42, 0x42);
	routing_table tbl(self, sett.bucket_size, sett, nullptr);

	TEST_CHECK(!tbl.node_seen(self, ep(1), 10));

	tbl.add_router_node(ep(2));
	TEST_CHECK(!tbl.node_seen(make_id(0x80, 1), ep(2), 10));
	TEST_EQUAL(tbl.size(), 0);
	TEST_EQUAL(std::distance(tbl.begin(), tbl.end()), 1);
	TEST_EQUAL(*tbl.begin(), ep(2));
}

DHTSCAN_TEST(heard_about_is_unconfirmed)
{
	dht_settings sett;
	routing_table tbl(node_id(), sett.bucket_size, sett, nullptr);

	tbl.heard_about(make_id(0x80, 1), ep(1));
	TEST_EQUAL(tbl.size(), 1);
	TEST_EQUAL(tbl.num_confirmed_nodes(), 0);
	node_entry const* n = tbl.find_node(make_id(0x80, 1));
	TEST_CHECK(n != nullptr);
	if (n == nullptr) return;
	TEST_CHECK(n->status(sett.max_fail_count) == node_status::unknown);

	// an unconfirmed node follows the last endpoint claiming its ID
	tbl.heard_about(make_id(0x80, 1), ep(2));
	n = tbl.find_node(make_id(0x80, 1));
	TEST_EQUAL(n->ep(), ep(2));

	tbl.node_seen(make_id(0x80, 1), ep(2), 100);
	TEST_EQUAL(tbl.num_confirmed_nodes(), 1);
	n = tbl.find_node(make_id(0x80, 1));
	TEST_CHECK(n->status(sett.max_fail_count) == node_status::good);
	TEST_EQUAL(n->rtt, 100);

	// once confirmed, another endpoint can't take the ID over
	tbl.heard_about(make_id(0x80, 1), ep(3));
	TEST_CHECK(!tbl.node_seen(make_id(0x80, 1), ep(3), 10));
	n = tbl.find_node(make_id(0x80, 1));
	TEST_EQUAL(n->ep(), ep(2));
	TEST_EQUAL(tbl.size(), 1);
}

DHTSCAN_TEST(node_failed)
{
	dht_settings sett;
	routing_table tbl(node_id(), sett.bucket_size, sett, nullptr);

	tbl.node_seen(make_id(0x80, 1), ep(1), 10);

	// a failure reported for a different endpoint is not held against the
	// node we know
	tbl.node_failed(make_id(0x80, 1), ep(9));
	TEST_EQUAL(tbl.find_node(make_id(0x80, 1))->fail_count(), 0);

	tbl.node_failed(make_id(0x80, 1), ep(1));
	node_entry const* n = tbl.find_node(make_id(0x80, 1));
	TEST_EQUAL(n->fail_count(), 1);
	TEST_CHECK(n->status(sett.max_fail_count) == node_status::questionable);
	TEST_EQUAL(tbl.num_confirmed_nodes(), 0);

	tbl.node_failed(make_id(0x80, 1), ep(1));
	tbl.node_failed(make_id(0x80, 1), ep(1));
	TEST_CHECK(n->status(sett.max_fail_count) == node_status::bad);

	// bad nodes are left out of lookups, unless asked for
	TEST_EQUAL(tbl.find_node(node_id(), {}).size(), 0);
	TEST_EQUAL(tbl.find_node(node_id(), routing_table::include_failed).size(), 1);

	// hearing back from it makes it good again
	tbl.node_seen(make_id(0x80, 1), ep(1), 10);
	TEST_CHECK(n->status(sett.max_fail_count) == node_status::good);

	tbl.mark_bad(make_id(0x80, 1));
	TEST_CHECK(n->status(sett.max_fail_count) == node_status::bad);
}

DHTSCAN_TEST(bucket_split)
{
	dht_settings sett;
	routing_table tbl(node_id(), sett.bucket_size, sett, nullptr);

	// fill the only bucket with nodes far away from us
	for (int i = 0; i < sett.bucket_size; ++i)
		TEST_CHECK(tbl.node_seen(make_id(0x80, std::uint8_t(i)), ep(i), 10));
	TEST_EQUAL(tbl.num_active_buckets(), 1);
	TEST_EQUAL(tbl.bucket_size(0), sett.bucket_size);

	// a node sharing a prefix with us splits the bucket
	TEST_CHECK(tbl.node_seen(make_id(0x01, 1), ep(100), 10));
	TEST_CHECK(tbl.num_active_buckets() > 1);
	TEST_EQUAL(tbl.bucket_size(0), sett.bucket_size);
	TEST_EQUAL(tbl.size(), sett.bucket_size + 1);

	// the far bucket is full and can't be split any more
	TEST_CHECK(!tbl.node_seen(make_id(0x80, 0xff), ep(200), 10));
	TEST_EQUAL(tbl.size(), sett.bucket_size + 1);
	TEST_CHECK(tbl.find_node(make_id(0x80, 0xff)) == nullptr);
}

DHTSCAN_TEST(replace_bad_node)
{
	dht_settings sett;
	routing_table tbl(node_id(), sett.bucket_size, sett, nullptr);

	for (int i = 0; i < sett.bucket_size; ++i)
		tbl.node_seen(make_id(0x80, std::uint8_t(i)), ep(i), 10);
	// force the split, so the far bucket can't grow
	tbl.node_seen(make_id(0x01, 1), ep(100), 10);

	for (int k = 0; k < sett.max_fail_count; ++k)
		tbl.node_failed(make_id(0x80, 3), ep(3));

	TEST_CHECK(tbl.node_seen(make_id(0x80, 0xff), ep(200), 10));
	TEST_CHECK(tbl.find_node(make_id(0x80, 0xff)) != nullptr);
	TEST_CHECK(tbl.find_node(make_id(0x80, 3)) == nullptr);
	TEST_EQUAL(tbl.bucket_size(0), sett.bucket_size);
}

DHTSCAN_TEST(many_nodes)
{
	dht_settings sett;
	node_id const self = generate_random_id();
	routing_table tbl(self, sett.bucket_size, sett, nullptr);

	for (int i = 0; i < 1000; ++i)
		tbl.node_seen(generate_random_id(), ep(i, 1000 + i), 10);

	// most random nodes fall in the far buckets, which hold 8 nodes each
	TEST_CHECK(tbl.size() >= sett.bucket_size * 5);
	TEST_CHECK(tbl.size() <= sett.bucket_size * tbl.num_active_buckets());

	node_id const target = generate_random_id();
	std::vector<node_entry> const nodes = tbl.find_node(target, {}, 8);
	TEST_EQUAL(nodes.size(), 8);
	TEST_CHECK(std::is_sorted(nodes.begin(), nodes.end()
		, [&target](node_entry const& lhs, node_entry const& rhs)
		{ return compare_ref(lhs.id, rhs.id, target); }));

#if DHTSCAN_USE_ASSERTS
	tbl.check_invariant();
#endif
}
