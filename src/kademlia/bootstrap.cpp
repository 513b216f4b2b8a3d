/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/kademlia/bootstrap.hpp"
#include "dhtscan/kademlia/node.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/kademlia/rpc_manager.hpp"
#include "dhtscan/kademlia/msg.hpp"

namespace dhtscan { namespace dht {

bootstrap::bootstrap(
	node& dht_node
	, node_id const& target
	, done_callback callback)
	: traversal_algorithm(dht_node, target)
	, m_done_callback(std::move(callback))
{
}

char const* bootstrap::name() const { return "bootstrap"; }

void bootstrap::start()
{
	// whatever is already in the table is a better starting point than the
	// routers, but the routers are always asked too
	std::vector<node_entry> const nodes = m_node.m_table.find_node(
		target(), {}, m_node.m_table.bucket_size());

	for (auto const& n : nodes)
		add_entry(n.id, n.ep(), observer::flag_initial);

	add_router_entries();
	init();
	step();
}

void bootstrap::traverse(node_id const& id, udp::endpoint const& addr
	, int const depth)
{
	if (depth > m_node.settings().bootstrap_max_rounds)
	{
		// still worth keeping in the routing table, just not worth asking
		m_node.m_table.heard_about(id, addr);
		return;
	}
	traversal_algorithm::traverse(id, addr, depth);
}

bool bootstrap::enough_results() const
{
	return m_node.m_table.size() >= m_node.settings().bootstrap_min_nodes;
}

bool bootstrap::invoke(observer_ptr o)
{
	if (is_done()) return false;

	query_message q;
	q.method = query_method::find_node;
	// in case our node id changes during the bootstrap, make sure to always use
	// the current node id (rather than the target stored in the traversal
	// algorithm)
	q.target = get_node().nid();

	return m_node.m_rpc.invoke(q, o->target_ep(), o);
}

observer_ptr bootstrap::new_observer(udp::endpoint const& ep
	, node_id const& id)
{
	return m_node.m_rpc.allocate_observer<traversal_observer>(self(), ep, id);
}

void bootstrap::done()
{
	done_callback cb = std::move(m_done_callback);
	m_done_callback = nullptr;

	traversal_algorithm::done();

#ifndef DHTSCAN_DISABLE_LOGGING
	auto* logger = get_node().logger();
	if (logger != nullptr)
	{
		logger->log(dht_logger::traversal, "[%u] bootstrap done, nodes: %d status: %s"
			, id(), m_node.m_table.size(), status_name(status()));
	}
#endif

	if (cb) cb(status());
}

} } // namespace dhtscan::dht
