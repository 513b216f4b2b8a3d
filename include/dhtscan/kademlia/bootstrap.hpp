/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_BOOTSTRAP_HPP
#define DHTSCAN_BOOTSTRAP_HPP

#include <functional>

#include "dhtscan/kademlia/traversal_algorithm.hpp"

namespace dhtscan {
namespace dht {

// fills the routing table by looking up our own node ID with find_node,
// starting from the router nodes
struct DHTSCAN_EXTRA_EXPORT bootstrap : traversal_algorithm
{
	using done_callback = std::function<void(traversal_status)>;

	bootstrap(node& dht_node, node_id const& target
		, done_callback callback);

	void start() override;
	void traverse(node_id const& id, udp::endpoint const& addr, int depth) override;

	char const* name() const override;

protected:

	bool enough_results() const override;
	bool invoke(observer_ptr o) override;
	observer_ptr new_observer(udp::endpoint const& ep
		, node_id const& id) override;

	void done() override;

	done_callback m_done_callback;
};

} // namesapce dht
} // namespace dhtscan

#endif // DHTSCAN_BOOTSTRAP_HPP
