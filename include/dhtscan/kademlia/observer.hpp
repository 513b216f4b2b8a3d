/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_OBSERVER_HPP_INCLUDED
#define DHTSCAN_OBSERVER_HPP_INCLUDED

#include <cstdint>
#include <memory>
#include <algorithm> // for min

#include "dhtscan/assert.hpp"
#include "dhtscan/time.hpp"
#include "dhtscan/flags.hpp"
#include "dhtscan/socket.hpp" // for udp
#include "dhtscan/kademlia/node_id.hpp"

namespace dhtscan {
namespace dht {

struct dht_logger;
struct observer;
struct msg;
struct traversal_algorithm;

using observer_flags_t = dhtscan::flags::bitfield_flag<std::uint8_t, struct observer_flags_tag>;

// an observer is one outstanding (or finished) query sent on behalf of a
// traversal_algorithm. It's kept alive by the traversal's result list and,
// while the query is in flight, by the rpc_manager's transaction table
struct DHTSCAN_EXTRA_EXPORT observer
	: std::enable_shared_from_this<observer>
{
	observer(std::shared_ptr<traversal_algorithm> a
		, udp::endpoint const& ep, node_id const& id)
		: m_algorithm(std::move(a))
		, m_id(id)
	{
		DHTSCAN_ASSERT(m_algorithm);
		set_target(ep);
	}

	observer(observer const&) = delete;
	observer& operator=(observer const&) = delete;

	// defined in rpc_manager.cpp
	virtual ~observer();

	// this is called when a reply is received
	virtual void reply(msg const& m) = 0;

	// this is called when no reply has been received within
	// some timeout, or the node replied with an error.
	virtual void timeout();

	// the rpc_manager is being destructed. The traversal is not told about
	// this query anymore
	void abort();

	dht_logger* get_logger() const;

	traversal_algorithm* algorithm() const { return m_algorithm.get(); }

	time_point sent() const { return m_sent; }

	void set_target(udp::endpoint const& ep);
	address target_addr() const;
	udp::endpoint target_ep() const;

	void set_id(node_id const& id);
	node_id const& id() const { return m_id; }

	// the number of hops between the nodes the traversal started from and
	// this one
	int depth() const { return m_depth; }
	void set_depth(int d) { m_depth = std::uint8_t(std::min(d, 0xff)); }

	static inline constexpr observer_flags_t flag_queried = 0_bit;
	static inline constexpr observer_flags_t flag_initial = 1_bit;
	static inline constexpr observer_flags_t flag_no_id = 2_bit;
	static inline constexpr observer_flags_t flag_failed = 3_bit;
	static inline constexpr observer_flags_t flag_alive = 4_bit;
	static inline constexpr observer_flags_t flag_done = 5_bit;

protected:

	void done();

private:

	std::shared_ptr<observer> self()
	{ return shared_from_this(); }

	time_point m_sent;

	std::shared_ptr<traversal_algorithm> const m_algorithm;

	node_id m_id;

	address_v4::bytes_type m_addr;

	std::uint16_t m_port = 0;

	std::uint8_t m_depth = 0;

public:
	observer_flags_t flags{};
};

using observer_ptr = std::shared_ptr<observer>;

}
}

#endif // DHTSCAN_OBSERVER_HPP_INCLUDED
