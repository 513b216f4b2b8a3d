/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_NODE_ENTRY_HPP_INCLUDED
#define DHTSCAN_NODE_ENTRY_HPP_INCLUDED

#include <cstdint>

#include "dhtscan/config.hpp"
#include "dhtscan/kademlia/node_id.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/time.hpp"

namespace dhtscan { namespace dht {

// the liveness of a node, as far as we know
enum class node_status : std::uint8_t
{
	// we have heard about the node but it never replied to us
	unknown,
	// the node replied and has not failed a query since
	good,
	// the node failed to respond to one or more of our latest queries
	questionable,
	// the node failed too many queries in a row, or was marked bad
	bad
};

DHTSCAN_EXTRA_EXPORT char const* status_name(node_status s);

struct DHTSCAN_EXTRA_EXPORT node_entry
{
	node_entry(node_id const& id_, udp::endpoint const& ep, int roundtriptime = 0xffff
		, bool pinged = false);
	explicit node_entry(udp::endpoint const& ep);
	node_entry() = default;

	void update_rtt(int new_rtt);

	// true if the node has replied to at least one of our queries
	bool pinged() const { return verified; }
	void timed_out();
	int fail_count() const { return timeout_count; }
	void reset_fail_count() { timeout_count = 0; }
	void mark_bad() { timeout_count = 0xff; }

	// a confirmed node has replied to us and has not timed out since
	bool confirmed() const { return verified && timeout_count == 0; }

	node_status status(int max_fail_count) const;

	udp::endpoint ep() const { return endpoint; }
	address addr() const { return endpoint.address(); }
	int port() const { return endpoint.port(); }

	// the time we last received a response for a request to this peer
	time_point last_seen = min_time();

	node_id id;

	udp::endpoint endpoint;

	// the average round-trip time of requests to this node, in milliseconds
	std::uint16_t rtt = 0xffff;

	// the number of times this node has failed to
	// respond in a row
	std::uint8_t timeout_count = 0;

	bool verified = false;
};

} } // namespace dhtscan::dht

#endif // DHTSCAN_NODE_ENTRY_HPP_INCLUDED
