/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_NODE_ID_HPP_INCLUDED
#define DHTSCAN_NODE_ID_HPP_INCLUDED

#include "dhtscan/config.hpp"
#include "dhtscan/sha1_hash.hpp"

namespace dhtscan { namespace dht {

using node_id = dhtscan::sha1_hash;

// returns the distance between the two nodes
// using the kademlia XOR-metric
DHTSCAN_EXTRA_EXPORT node_id distance(node_id const& n1, node_id const& n2);

// returns true if: distance(n1, ref) < distance(n2, ref)
DHTSCAN_EXTRA_EXPORT bool compare_ref(node_id const& n1, node_id const& n2, node_id const& ref);

// returns n in: 2^n <= distance(n1, n2) < 2^(n+1)
// useful for finding out which bucket a node belongs to
DHTSCAN_EXTRA_EXPORT int distance_exp(node_id const& n1, node_id const& n2);

DHTSCAN_EXTRA_EXPORT node_id generate_random_id();

// returns an id with the ``bits`` most significant bits set
DHTSCAN_EXTRA_EXPORT node_id generate_prefix_mask(int bits);

} } // namespace dhtscan::dht

#endif // DHTSCAN_NODE_ID_HPP_INCLUDED
