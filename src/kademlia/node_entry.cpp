/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/kademlia/node_entry.hpp"
#include "dhtscan/assert.hpp"

namespace dhtscan { namespace dht {

	char const* status_name(node_status const s)
	{
		switch (s)
		{
			case node_status::unknown: return "unknown";
			case node_status::good: return "good";
			case node_status::questionable: return "questionable";
			case node_status::bad: return "bad";
		}
		return "";
	}

	node_entry::node_entry(node_id const& id_, udp::endpoint const& ep
		, int const roundtriptime
		, bool const pinged)
		: last_seen(pinged ? clock_type::now() : min_time())
		, id(id_)
		, endpoint(ep)
		, rtt(roundtriptime & 0xffff)
		, timeout_count(0)
		, verified(pinged)
	{}

	node_entry::node_entry(udp::endpoint const& ep)
		: endpoint(ep)
	{}

	void node_entry::update_rtt(int const new_rtt)
	{
		DHTSCAN_ASSERT(new_rtt <= 0xffff);
		DHTSCAN_ASSERT(new_rtt >= 0);
		if (new_rtt == 0xffff) return;
		if (rtt == 0xffff) rtt = std::uint16_t(new_rtt);
		else rtt = std::uint16_t(int(rtt) * 2 / 3 + new_rtt / 3);
	}

	void node_entry::timed_out()
	{
		if (timeout_count < 0xff) ++timeout_count;
	}

	node_status node_entry::status(int const max_fail_count) const
	{
		if (timeout_count >= max_fail_count) return node_status::bad;
		if (timeout_count > 0) return node_status::questionable;
		return verified ? node_status::good : node_status::unknown;
	}

}}
