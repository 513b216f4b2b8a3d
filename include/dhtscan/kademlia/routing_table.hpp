/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_ROUTING_TABLE_HPP_INCLUDED
#define DHTSCAN_ROUTING_TABLE_HPP_INCLUDED

#include <vector>
#include <set>
#include <functional>

#include "dhtscan/config.hpp"
#include "dhtscan/flags.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/kademlia/node_id.hpp"
#include "dhtscan/kademlia/node_entry.hpp"

namespace dhtscan { namespace dht {

struct dht_settings;
struct dht_logger;

using bucket_t = std::vector<node_entry>;

struct routing_table_node
{
	bucket_t live_nodes;
};

using find_nodes_flags_t = flags::bitfield_flag<std::uint8_t, struct find_nodes_flags_tag>;

// Bucket i (except the last one) holds the nodes whose id shares exactly i
// leading bits with our own id. The last bucket holds every node sharing at
// least as many bits, i.e. it is the one covering our own id. Only that
// bucket is ever split.
//
// differences from the description in the paper:
//
// * Nodes are not marked as being stale, they keep a counter
// 	that tells how many times in a row they have failed. Once
// 	it reaches max_fail_count the node is considered bad. When
// 	a new node is to be inserted into a full bucket, the bad node
// 	we have heard from the longest time ago is replaced. If none of
// 	the nodes in the bucket are bad, the new node is dropped.
// * There is no replacement cache.
//
// The table is not thread safe. It's only ever touched from the thread
// running the io_context.
class DHTSCAN_EXTRA_EXPORT routing_table
{
public:
	using table_t = std::vector<routing_table_node>;

	routing_table(node_id const& id, int bucket_size
		, dht_settings const& settings
		, dht_logger* log);

	routing_table(routing_table const&) = delete;
	routing_table& operator=(routing_table const&) = delete;

	// increments the fail count of the node, if we have it with this endpoint
	void node_failed(node_id const& id, udp::endpoint const& ep);

	// the node will be considered bad until it replies to us again
	void mark_bad(node_id const& id);

	// adds an endpoint that will never be added to
	// the routing table
	void add_router_node(udp::endpoint const& router);

	// iterates over the router nodes added
	using router_iterator = std::set<udp::endpoint>::const_iterator;
	router_iterator begin() const { return m_router_nodes.begin(); }
	router_iterator end() const { return m_router_nodes.end(); }

	enum add_node_status_t {
		failed_to_add = 0,
		node_added,
		need_bucket_split
	};
	add_node_status_t add_node_impl(node_entry e);

	// inserts or updates the node. Returns false if the node was not added
	bool add_node(node_entry const& e);

	// this function is called every time the node sees
	// a sign of a node being alive. This node will either
	// be inserted in the k-buckets or have its fail count reset
	bool node_seen(node_id const& id, udp::endpoint const& ep, int rtt);

	// this may add a node to the routing table and mark it as
	// not pinged. If the bucket the node falls into is full,
	// the node will be ignored.
	void heard_about(node_id const& id, udp::endpoint const& ep);

	// bad nodes are excluded unless this flag is passed
	static constexpr find_nodes_flags_t include_failed = 0_bit;

	// returns the ``count`` nodes from our buckets that are nearest to the
	// given id, closest first. If count is 0, the bucket size is used
	std::vector<node_entry> find_node(node_id const& target
		, find_nodes_flags_t options, int count = 0) const;

	// returns the entry for the node, or nullptr if it's not in the table
	node_entry const* find_node(node_id const& id) const;

	int bucket_size(int bucket) const
	{
		int num_buckets = int(m_buckets.size());
		if (num_buckets == 0) return 0;
		if (bucket >= num_buckets) bucket = num_buckets - 1;
		return int(m_buckets[std::size_t(bucket)].live_nodes.size());
	}

	void for_each_node(std::function<void(node_entry const&)> f) const;

	int bucket_size() const { return m_bucket_size; }

	// the number of nodes in the buckets, regardless of their status
	int size() const;

	// the number of nodes in the buckets that have replied to us and not
	// failed since
	int num_confirmed_nodes() const;

	int num_active_buckets() const { return int(m_buckets.size()); }

	node_id const& id() const
	{ return m_id; }

	table_t const& buckets() const
	{ return m_buckets; }

#if DHTSCAN_USE_ASSERTS
	void check_invariant() const;
#endif

private:

#ifndef DHTSCAN_DISABLE_LOGGING
	dht_logger* m_log;
#endif

	table_t::iterator find_bucket(node_id const& id);
	int bucket_index(node_id const& id) const;

	void split_bucket();

	node_entry* find_entry(node_id const& id);

	dht_settings const& m_settings;

	// the first entry is the bucket the furthest
	// away from our own ID. Each time the bucket
	// closest to us (m_buckets.back()) has more than
	// bucket size nodes in it, another bucket is
	// added to the end and it's split up between them
	table_t m_buckets;

	node_id m_id; // our own node id

	// this is a set of all the endpoints that have
	// been identified as router nodes. They will
	// be used in searches, but they will never
	// be added to the routing table.
	std::set<udp::endpoint> m_router_nodes;

	// constant called k in paper
	int const m_bucket_size;
};

} } // namespace dhtscan::dht

#endif // DHTSCAN_ROUTING_TABLE_HPP_INCLUDED
