/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/kademlia/get_peers.hpp"
#include "dhtscan/kademlia/node.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/kademlia/rpc_manager.hpp"
#include "dhtscan/kademlia/msg.hpp"
#include "dhtscan/socket_io.hpp"

#ifndef DHTSCAN_DISABLE_LOGGING
#include "dhtscan/hex.hpp" // to_hex
#endif

namespace dhtscan { namespace dht {

void get_peers_observer::reply(msg const& m)
{
	if (!m.message.peers.empty())
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		log_peers(m);
#endif
		static_cast<get_peers*>(algorithm())->got_peers(m.message.peers);
	}

	traversal_observer::reply(m);
}

#ifndef DHTSCAN_DISABLE_LOGGING
void get_peers_observer::log_peers(msg const& m) const
{
	auto logger = get_logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal))
	{
		logger->log(dht_logger::traversal, "[%u] PEERS "
			"invoke-count: %d branch-factor: %d addr: %s id: %s distance: %d p: %d"
			, algorithm()->id()
			, algorithm()->invoke_count()
			, algorithm()->branch_factor()
			, print_endpoint(m.addr).c_str()
			, aux::to_hex(m.message.sender).c_str()
			, distance_exp(algorithm()->target(), m.message.sender)
			, int(m.message.peers.size()));
	}
}
#endif

get_peers::get_peers(
	node& dht_node
	, node_id const& target
	, data_callback dcallback
	, done_callback ncallback)
	: traversal_algorithm(dht_node, target)
	, m_data_callback(std::move(dcallback))
	, m_done_callback(std::move(ncallback))
{
}

void get_peers::got_peers(std::vector<tcp::endpoint> const& peers)
{
	if (is_done()) return;

	std::vector<tcp::endpoint> fresh;
	for (auto const& p : peers)
	{
		if (m_peers.insert(p).second) fresh.push_back(p);
	}
	if (!fresh.empty() && m_data_callback) m_data_callback(fresh);
}

void get_peers::start()
{
	// seed the lookup with the k nodes from the routing table closest to the
	// info-hash
	if (m_results.empty())
	{
		std::vector<node_entry> const nodes = m_node.m_table.find_node(
			target(), {}, m_node.m_table.bucket_size());

		for (auto const& n : nodes)
			add_entry(n.id, n.ep(), observer::flag_initial);
	}

	traversal_algorithm::start();
}

char const* get_peers::name() const { return "get_peers"; }

bool get_peers::invoke(observer_ptr o)
{
	if (is_done()) return false;

	query_message q;
	q.method = query_method::get_peers;
	q.target = target();

	return m_node.m_rpc.invoke(q, o->target_ep(), o);
}

observer_ptr get_peers::new_observer(udp::endpoint const& ep
	, node_id const& id)
{
	return m_node.m_rpc.allocate_observer<get_peers_observer>(self(), ep, id);
}

void get_peers::done()
{
	// the callback may drop the last reference to this object, it's moved
	// out before anything else happens
	done_callback cb = std::move(m_done_callback);
	m_done_callback = nullptr;
	m_data_callback = nullptr;

	traversal_algorithm::done();

#ifndef DHTSCAN_DISABLE_LOGGING
	auto* logger = get_node().logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal))
	{
		logger->log(dht_logger::traversal, "[%u] %s DONE peers: %d status: %s"
			, id(), name(), int(m_peers.size()), status_name(status()));
	}
#endif

	if (!cb) return;
	std::vector<tcp::endpoint> const peers(m_peers.begin(), m_peers.end());
	cb(peers, status());
}

} } // namespace dhtscan::dht
