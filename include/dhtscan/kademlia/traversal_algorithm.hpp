/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_TRAVERSAL_ALGORITHM_HPP_INCLUDED
#define DHTSCAN_TRAVERSAL_ALGORITHM_HPP_INCLUDED

#include <vector>
#include <memory>
#include <cstdint>

#include "dhtscan/config.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/time.hpp"
#include "dhtscan/kademlia/node_id.hpp"
#include "dhtscan/kademlia/routing_table.hpp"
#include "dhtscan/kademlia/observer.hpp"

namespace dhtscan {

namespace dht {

class node;

// the way a traversal ended
enum class traversal_status : std::uint8_t
{
	running,
	// the closest nodes have all replied, or there was no one left to ask
	converged,
	// the deadline passed before the traversal converged
	timed_out,
	// abort() was called
	aborted
};

DHTSCAN_EXTRA_EXPORT char const* status_name(traversal_status s);

// this class may not be instantiated as a stack object
struct DHTSCAN_EXTRA_EXPORT traversal_algorithm
	: std::enable_shared_from_this<traversal_algorithm>
{
	// adds a node we learned about (from the reply of the node ``depth - 1``
	// hops in) to the candidates
	virtual void traverse(node_id const& id, udp::endpoint const& addr, int depth);
	void finished(observer_ptr o);

	void failed(observer_ptr o);
	virtual ~traversal_algorithm();

	virtual char const* name() const;
	virtual void start();

	// the traversal finishes as timed_out once this time has passed. It's
	// checked by tick() and every time a reply or timeout arrives
	void set_deadline(time_point deadline) { m_deadline = deadline; }
	time_point deadline() const { return m_deadline; }

	// called periodically by the node
	void tick(time_point now);

	// stops the traversal. Queries still in flight are abandoned
	void abort();

	node_id const& target() const { return m_target; }

	void resort_result(observer*);
	void add_entry(node_id const& id, udp::endpoint const& addr
		, observer_flags_t flags, int depth = 0);

	traversal_algorithm(node& dht_node, node_id const& target);
	traversal_algorithm(traversal_algorithm const&) = delete;
	traversal_algorithm& operator=(traversal_algorithm const&) = delete;
	int invoke_count() const { DHTSCAN_ASSERT(m_invoke_count >= 0); return m_invoke_count; }
	int branch_factor() const { DHTSCAN_ASSERT(m_branch_factor >= 0); return m_branch_factor; }

	int num_responses() const { return m_responses; }
	int num_timeouts() const { return m_timeouts; }

	bool is_done() const { return m_done; }
	traversal_status status() const { return m_status; }

	node& get_node() const { return m_node; }

	std::uint32_t id() const { return m_id; }

protected:

	std::shared_ptr<traversal_algorithm> self()
	{ return shared_from_this(); }

	// returns true if we're done
	bool add_requests();

	// sends more requests, or finishes the traversal if it's done
	void step();

	// ends the traversal with the given status, unless it already ended
	void finish(traversal_status s);

	void add_router_entries();
	void init();

	// a traversal may decide it has found what it was looking for before
	// converging
	virtual bool enough_results() const { return false; }

	virtual void done();

	// should construct an algorithm dependent
	// observer in ptr.
	virtual observer_ptr new_observer(udp::endpoint const& ep
		, node_id const& id) = 0;

	virtual bool invoke(observer_ptr) = 0;

	node& m_node;

	// this vector is sorted by node-id distance from our node id. Closer nodes
	// are earlier in the vector. However, not the entire vector is necessarily
	// sorted, the tail of the vector may contain nodes out-of-order. This is
	// used for router nodes, whose IDs we don't know until they reply. The
	// ``m_sorted_results`` member indicates how many of the first elements
	// are sorted.
	std::vector<observer_ptr> m_results;

private:

	node_id const m_target;
	time_point m_deadline = max_time();
	std::int16_t m_invoke_count = 0;
	std::int16_t m_branch_factor = 3;
	// the number of elements at the beginning of m_results that are sorted by
	// node_id.
	std::int16_t m_sorted_results = 0;
	std::int16_t m_responses = 0;
	std::int16_t m_timeouts = 0;

	// set to true when done() is called, and will prevent adding new results, as
	// they would never be serviced and the whole traversal algorithm would stall
	// and leak
	bool m_done = false;

	traversal_status m_status = traversal_status::running;

	// this is a unique ID for this specific traversal_algorithm instance,
	// just used for logging
	std::uint32_t m_id;

#ifndef DHTSCAN_DISABLE_LOGGING
	void log_timeout(observer_ptr const& o, char const* prefix) const;
#endif
};

struct DHTSCAN_EXTRA_EXPORT traversal_observer : observer
{
	traversal_observer(
		std::shared_ptr<traversal_algorithm> algorithm
		, udp::endpoint const& ep, node_id const& id)
		: observer(std::move(algorithm), ep, id)
	{}

	// parses out "nodes" and keeps traversing
	void reply(msg const&) override;
};

} // namespace dht
} // namespace dhtscan

#endif // DHTSCAN_TRAVERSAL_ALGORITHM_HPP_INCLUDED
