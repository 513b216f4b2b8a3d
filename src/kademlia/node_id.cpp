/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>

#include "dhtscan/kademlia/node_id.hpp"
#include "dhtscan/assert.hpp"
#include "dhtscan/random.hpp"

namespace dhtscan { namespace dht {

node_id distance(node_id const& n1, node_id const& n2)
{
	return n1 ^ n2;
}

bool compare_ref(node_id const& n1, node_id const& n2, node_id const& ref)
{
	node_id const lhs = n1 ^ ref;
	node_id const rhs = n2 ^ ref;
	return lhs < rhs;
}

int distance_exp(node_id const& n1, node_id const& n2)
{
	// identical ids have distance 0, and so does the pair differing only in
	// the last bit. The routing table never holds our own id, which keeps
	// this from mattering
	return std::max(159 - distance(n1, n2).count_leading_zeroes(), 0);
}

node_id generate_random_id()
{
	node_id ret;
	aux::random_bytes({ret.data(), node_id::size()});
	return ret;
}

node_id generate_prefix_mask(int const bits)
{
	DHTSCAN_ASSERT(bits >= 0);
	DHTSCAN_ASSERT(bits <= 160);
	node_id mask;
	std::size_t b = 0;
	for (; int(b) < bits - 7; b += 8) mask[b / 8] = 0xff;
	if (int(b) < bits) mask[b / 8] = std::uint8_t((0xff << (8 - (bits & 7))) & 0xff);
	return mask;
}

} } // namespace dhtscan::dht
