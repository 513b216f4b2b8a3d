/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <iterator>

#include "dhtscan/kademlia/traversal_algorithm.hpp"
#include "dhtscan/kademlia/rpc_manager.hpp"
#include "dhtscan/kademlia/node.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/kademlia/msg.hpp"
#include "dhtscan/socket_io.hpp"

#ifndef DHTSCAN_DISABLE_LOGGING
#include "dhtscan/hex.hpp" // to_hex
#endif

namespace dhtscan {
namespace dht {

#if DHTSCAN_USE_ASSERTS
template <class It, class Cmp>
bool is_sorted(It b, It e, Cmp cmp)
{
	if (b == e) return true;

	typename std::iterator_traits<It>::value_type v = *b;
	++b;
	while (b != e)
	{
		if (cmp(*b, v)) return false;
		v = *b;
		++b;
	}
	return true;
}
#endif

char const* status_name(traversal_status const s)
{
	switch (s)
	{
		case traversal_status::running: return "running";
		case traversal_status::converged: return "converged";
		case traversal_status::timed_out: return "timed-out";
		case traversal_status::aborted: return "aborted";
	}
	return "";
}

traversal_algorithm::traversal_algorithm(node& dht_node, node_id const& target)
	: m_node(dht_node)
	, m_target(target)
	, m_id(dht_node.search_id())
{
#ifndef DHTSCAN_DISABLE_LOGGING
	dht_logger* logger = get_node().logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal))
	{
		logger->log(dht_logger::traversal, "[%u] NEW target: %s k: %d"
			, m_id, aux::to_hex(target).c_str(), m_node.m_table.bucket_size());
	}
#endif
}

void traversal_algorithm::resort_result(observer* o)
{
	// find the given observer, remove it and insert it in its sorted location
	auto it = std::find_if(m_results.begin(), m_results.end()
		, [=](observer_ptr const& ptr) { return ptr.get() == o; });

	if (it == m_results.end()) return;

	if (it - m_results.begin() < m_sorted_results)
		--m_sorted_results;

	observer_ptr ptr = std::move(*it);
	m_results.erase(it);

	DHTSCAN_ASSERT(std::size_t(m_sorted_results) <= m_results.size());
	auto end = m_results.begin() + m_sorted_results;

	DHTSCAN_ASSERT(dhtscan::dht::is_sorted(m_results.begin(), end
		, [this](observer_ptr const& lhs, observer_ptr const& rhs)
		{ return compare_ref(lhs->id(), rhs->id(), m_target); }));

	auto iter = std::lower_bound(m_results.begin(), end, ptr
		, [this](observer_ptr const& lhs, observer_ptr const& rhs)
		{ return compare_ref(lhs->id(), rhs->id(), m_target); });

	m_results.insert(iter, ptr);
	++m_sorted_results;
}

void traversal_algorithm::add_entry(node_id const& id
	, udp::endpoint const& addr, observer_flags_t const flags, int const depth)
{
	if (m_done) return;

	auto o = new_observer(addr, id);
	if (!o)
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (get_node().logger() != nullptr)
		{
			get_node().logger()->log(dht_logger::traversal, "[%u] failed to allocate memory or observer. aborting!"
				, m_id);
		}
#endif
		finish(traversal_status::aborted);
		return;
	}

	o->flags |= flags;
	o->set_depth(depth);

	if (id.is_all_zeros())
	{
		o->set_id(generate_random_id());
		o->flags |= observer::flag_no_id;

		m_results.push_back(o);

#ifndef DHTSCAN_DISABLE_LOGGING
		dht_logger* logger = get_node().logger();
		if (logger != nullptr && logger->should_log(dht_logger::traversal))
		{
			logger->log(dht_logger::traversal
				, "[%u] ADD (no-id) addr: %s invoke-count: %d type: %s"
				, m_id, print_endpoint(addr).c_str(), int(m_invoke_count), name());
		}
#endif
	}
	else
	{
		DHTSCAN_ASSERT(std::size_t(m_sorted_results) <= m_results.size());
		auto end = m_results.begin() + m_sorted_results;

		DHTSCAN_ASSERT(dhtscan::dht::is_sorted(m_results.begin(), end
				, [this](observer_ptr const& lhs, observer_ptr const& rhs)
				{ return compare_ref(lhs->id(), rhs->id(), m_target); }));

		auto iter = std::lower_bound(m_results.begin(), end, o
			, [this](observer_ptr const& lhs, observer_ptr const& rhs)
			{ return compare_ref(lhs->id(), rhs->id(), m_target); });

		if (iter == end || (*iter)->id() != id)
		{
#ifndef DHTSCAN_DISABLE_LOGGING
			dht_logger* logger = get_node().logger();
			if (logger != nullptr && logger->should_log(dht_logger::traversal))
			{
				logger->log(dht_logger::traversal
					, "[%u] ADD id: %s addr: %s distance: %d depth: %d invoke-count: %d type: %s"
					, m_id, aux::to_hex(id).c_str(), print_endpoint(addr).c_str()
					, distance_exp(m_target, id), depth, int(m_invoke_count), name());
			}
#endif
			m_results.insert(iter, o);
			++m_sorted_results;
		}
	}

	DHTSCAN_ASSERT(std::size_t(m_sorted_results) <= m_results.size());
	DHTSCAN_ASSERT(dhtscan::dht::is_sorted(m_results.begin()
		, m_results.begin() + m_sorted_results
		, [this](observer_ptr const& lhs, observer_ptr const& rhs)
		{ return compare_ref(lhs->id(), rhs->id(), m_target); }));

	// queries still in flight to the nodes cut off here are not cancelled.
	// They are accounted for in m_invoke_count and still call finished() or
	// failed(), which keeps the traversal moving. The node whose reply is
	// being processed may be one of them
	int const max_results = m_node.settings().max_results;
	if (int(m_results.size()) > max_results)
	{
		m_results.resize(std::size_t(max_results));
		m_sorted_results = std::int16_t(std::min(max_results, int(m_sorted_results)));
	}
}

void traversal_algorithm::start()
{
	// in case the routing table is empty, use the
	// router nodes in the table
	if (m_results.size() < 3) add_router_entries();
	init();
	step();
}

char const* traversal_algorithm::name() const
{
	return "traversal_algorithm";
}

void traversal_algorithm::traverse(node_id const& id, udp::endpoint const& addr
	, int const depth)
{
	if (m_done) return;

#ifndef DHTSCAN_DISABLE_LOGGING
	dht_logger* logger = get_node().logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal) && id.is_all_zeros())
	{
		logger->log(dht_logger::traversal
			, "[%u] WARNING node returned a list which included a node with id 0"
			, m_id);
	}
#endif

	// nodes that have stopped answering us are not worth another query
	node_entry const* known = m_node.m_table.find_node(id);
	if (known != nullptr && known->endpoint == addr
		&& known->status(m_node.settings().max_fail_count) == node_status::bad)
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (logger != nullptr && logger->should_log(dht_logger::traversal))
		{
			logger->log(dht_logger::traversal, "[%u] SKIP bad node id: %s addr: %s"
				, m_id, aux::to_hex(id).c_str(), print_endpoint(addr).c_str());
		}
#endif
		return;
	}

	// let the routing table know this node may exist
	m_node.m_table.heard_about(id, addr);

	add_entry(id, addr, {}, depth);
}

void traversal_algorithm::finished(observer_ptr o)
{
	// a reply to a query that was cut from m_results, arriving after the
	// traversal ended
	if (m_done) return;

#if DHTSCAN_USE_ASSERTS
	auto i = std::find(m_results.begin(), m_results.end(), o);
	DHTSCAN_ASSERT(i != m_results.end()
		|| int(m_results.size()) == m_node.settings().max_results);
#endif

	DHTSCAN_ASSERT(o->flags & observer::flag_queried);
	o->flags |= observer::flag_alive;

	++m_responses;
	DHTSCAN_ASSERT(m_invoke_count > 0);
	--m_invoke_count;
	step();
}

void traversal_algorithm::failed(observer_ptr o)
{
	// don't tell the routing table about
	// node ids that we just generated ourself
	if (!(o->flags & observer::flag_no_id))
		m_node.m_table.node_failed(o->id(), o->target_ep());

	if (m_done || m_results.empty()) return;

	DHTSCAN_ASSERT(o->flags & observer::flag_queried);
	o->flags |= observer::flag_failed;

#ifndef DHTSCAN_DISABLE_LOGGING
	log_timeout(o, "");
#endif

	++m_timeouts;
	DHTSCAN_ASSERT(m_invoke_count > 0);
	--m_invoke_count;

	step();
}

#ifndef DHTSCAN_DISABLE_LOGGING
void traversal_algorithm::log_timeout(observer_ptr const& o, char const* prefix) const
{
	dht_logger* logger = get_node().logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal))
	{
		logger->log(dht_logger::traversal
			, "[%u] %sTIMEOUT id: %s distance: %d addr: %s branch-factor: %d "
			"invoke-count: %d type: %s"
			, m_id, prefix, aux::to_hex(o->id()).c_str(), distance_exp(m_target, o->id())
			, print_address(o->target_addr()).c_str(), int(m_branch_factor)
			, int(m_invoke_count), name());
	}
}
#endif

void traversal_algorithm::tick(time_point const now)
{
	if (m_done) return;
	if (now < m_deadline) return;

#ifndef DHTSCAN_DISABLE_LOGGING
	dht_logger* logger = get_node().logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal))
	{
		logger->log(dht_logger::traversal, "[%u] DEADLINE invoke-count: %d type: %s"
			, m_id, int(m_invoke_count), name());
	}
#endif
	finish(traversal_status::timed_out);
}

void traversal_algorithm::abort()
{
	finish(traversal_status::aborted);
}

void traversal_algorithm::step()
{
	if (m_done) return;

	if (clock_type::now() >= m_deadline)
	{
		finish(traversal_status::timed_out);
		return;
	}

	if (add_requests()) finish(traversal_status::converged);
}

void traversal_algorithm::finish(traversal_status const s)
{
	if (m_done) return;
	m_status = s;
	done();
}

void traversal_algorithm::done()
{
	DHTSCAN_ASSERT(m_done == false);
	m_done = true;
#ifndef DHTSCAN_DISABLE_LOGGING
	int results_target = m_node.m_table.bucket_size();
	int closest_target = 160;
#endif

	for (auto const& o : m_results)
	{
		if ((o->flags & (observer::flag_queried | observer::flag_failed)) == observer::flag_queried)
		{
			// set the done flag on any outstanding queries to prevent them from
			// calling finished() or failed() after we've already declared the traversal
			// done
			o->flags |= observer::flag_done;
		}

#ifndef DHTSCAN_DISABLE_LOGGING
		dht_logger* logger = get_node().logger();
		if (results_target > 0 && (o->flags & observer::flag_alive)
			&& logger != nullptr && logger->should_log(dht_logger::traversal))
		{
			DHTSCAN_ASSERT(o->flags & observer::flag_queried);
			logger->log(dht_logger::traversal
				, "[%u] id: %s distance: %d addr: %s"
				, m_id, aux::to_hex(o->id()).c_str(), closest_target
				, print_endpoint(o->target_ep()).c_str());

			--results_target;
			int const dist = distance_exp(m_target, o->id());
			if (dist < closest_target) closest_target = dist;
		}
#endif
	}

#ifndef DHTSCAN_DISABLE_LOGGING
	if (get_node().logger() != nullptr)
	{
		get_node().logger()->log(dht_logger::traversal
			, "[%u] COMPLETED distance: %d status: %s responses: %d timeouts: %d type: %s"
			, m_id, closest_target, status_name(m_status), int(m_responses)
			, int(m_timeouts), name());
	}
#endif

	// delete all our references to the observer objects so
	// they will in turn release the traversal algorithm
	m_results.clear();
	m_sorted_results = 0;
	m_invoke_count = 0;
}

bool traversal_algorithm::add_requests()
{
	if (m_done) return true;
	if (enough_results()) return true;

	int results_target = m_node.m_table.bucket_size();

	// this only counts outstanding requests at the top of the
	// target list. This is <= m_invoke count. m_invoke_count
	// is the total number of outstanding requests, including
	// old ones that may be waiting on nodes much farther behind
	// the current point we've reached in the search.
	int outstanding = 0;

	// Find the first node that hasn't already been queried.
	// and make sure that at most 'm_branch_factor' requests are
	// outstanding at any time, without surpassing the 'result_target'
	// nodes (i.e. k=8) closest nodes that have replied
	for (auto i = m_results.begin()
		, end(m_results.end()); i != end
		&& results_target > 0
		&& m_invoke_count < m_branch_factor;
		++i)
	{
		observer* o = i->get();
		if (o->flags & observer::flag_alive)
		{
			DHTSCAN_ASSERT(o->flags & observer::flag_queried);
			--results_target;
			continue;
		}
		if (o->flags & observer::flag_queried)
		{
			// if it's queried, not alive and not failed, it
			// must be currently in flight
			if (!(o->flags & observer::flag_failed))
				++outstanding;

			continue;
		}

#ifndef DHTSCAN_DISABLE_LOGGING
		dht_logger* logger = get_node().logger();
		if (logger != nullptr && logger->should_log(dht_logger::traversal))
		{
			logger->log(dht_logger::traversal
				, "[%u] INVOKE nodes-left: %d top-invoke-count: %d "
				"invoke-count: %d branch-factor: %d "
				"distance: %d id: %s addr: %s type: %s"
				, m_id, int(m_results.end() - i), outstanding, int(m_invoke_count)
				, int(m_branch_factor), distance_exp(m_target, o->id()), aux::to_hex(o->id()).c_str()
				, print_address(o->target_addr()).c_str(), name());
		}
#endif

		o->flags |= observer::flag_queried;
		if (invoke(*i))
		{
			++m_invoke_count;
			++outstanding;
		}
		else
		{
			// the query never left, there is nothing to wait for
			o->flags |= observer::flag_failed | observer::flag_done;
		}
	}

	// this is the completion condition. If we found m_node.m_table.bucket_size()
	// (i.e. k=8) completed results, without finding any still
	// outstanding requests, we're done.
	// also, if invoke count is 0, it means we didn't even find 'k'
	// working nodes, we still have to terminate though.
	return (results_target == 0 && outstanding == 0) || m_invoke_count == 0;
}

void traversal_algorithm::add_router_entries()
{
#ifndef DHTSCAN_DISABLE_LOGGING
	dht_logger* logger = get_node().logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal))
	{
		logger->log(dht_logger::traversal
			, "[%u] using router nodes to initiate traversal algorithm %d routers"
			, m_id, int(std::distance(m_node.m_table.begin(), m_node.m_table.end())));
	}
#endif
	for (auto const& n : m_node.m_table)
		add_entry(node_id(), n, observer::flag_initial);
}

void traversal_algorithm::init()
{
	m_branch_factor = std::int16_t(std::max(1, m_node.branch_factor()));
	m_node.add_traversal_algorithm(this);
}

traversal_algorithm::~traversal_algorithm()
{
	m_node.remove_traversal_algorithm(this);
}

void traversal_observer::reply(msg const& m)
{
	response_message const& r = m.message;

#ifndef DHTSCAN_DISABLE_LOGGING
	dht_logger* logger = get_logger();
	if (logger != nullptr && logger->should_log(dht_logger::traversal))
	{
		logger->log(dht_logger::traversal
			, "[%u] RESPONSE id: %s invoke-count: %d nodes: %d addr: %s type: %s"
			, algorithm()->id(), aux::to_hex(r.sender).c_str(), algorithm()->invoke_count()
			, int(r.nodes.size()), print_endpoint(target_ep()).c_str(), algorithm()->name());
	}
#endif

	for (auto const& n : r.nodes)
		algorithm()->traverse(n.id, n.ep, depth() + 1);

	// in case we didn't know the id of this peer when we sent the message to
	// it. For instance if it's a router node.
	set_id(r.sender);
	done();
}

} } // namespace dhtscan::dht
