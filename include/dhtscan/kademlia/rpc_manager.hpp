/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_RPC_MANAGER_HPP_INCLUDED
#define DHTSCAN_RPC_MANAGER_HPP_INCLUDED

#include <unordered_map>
#include <cstdint>
#include <memory>
#include <new> // for placement new

#include <boost/pool/pool.hpp>

#include "dhtscan/config.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/time.hpp"
#include "dhtscan/kademlia/node_id.hpp"
#include "dhtscan/kademlia/observer.hpp"
#include "dhtscan/kademlia/msg.hpp"

namespace dhtscan {
namespace dht {

struct dht_settings;
struct dht_logger;
struct socket_manager;

class routing_table;

// owns the queries in flight. It hands out transaction IDs, matches replies
// and errors to the observer that sent the query and times out queries that
// are never answered
class DHTSCAN_EXTRA_EXPORT rpc_manager
{
public:

	rpc_manager(node_id const& our_id
		, dht_settings const& settings
		, routing_table& table
		, socket_manager* sock_man
		, dht_logger* log);
	~rpc_manager();

	rpc_manager(rpc_manager const&) = delete;
	rpc_manager& operator=(rpc_manager const&) = delete;

	// handles a response or error message. Returns true if it was the
	// answer to one of our queries (and the node was confirmed alive)
	bool incoming(message const& m, udp::endpoint const& from);

	// times out the queries that have been outstanding for longer than
	// the query timeout. Returns the time until the next query may time out
	time_duration tick(time_point now);

	// fills in the transaction ID and our node ID, and sends the query.
	// Returns false if the query could not be sent
	bool invoke(query_message& q, udp::endpoint const& target
		, observer_ptr o);

	template <typename T, typename... Args>
	std::shared_ptr<T> allocate_observer(Args&&... args)
	{
		static_assert(sizeof(T) <= observer_size, "observer type too large for the pool");
		void* ptr = allocate_observer();
		if (ptr == nullptr) return std::shared_ptr<T>();

		auto deleter = [this](observer* o)
		{
			o->~observer();
			free_observer(o);
		};
		return std::shared_ptr<T>(new (ptr) T(std::forward<Args>(args)...), deleter);
	}

	int num_allocated_observers() const { return m_allocated_observers; }

	// the number of queries waiting for a reply
	int num_pending() const { return int(m_transactions.size()); }

private:

	static constexpr std::size_t observer_size = 128;

	void* allocate_observer();
	void free_observer(void* ptr);

	std::uint16_t next_transaction_id();

	mutable boost::pool<> m_pool_allocator;

	std::unordered_map<std::uint16_t, observer_ptr> m_transactions;

	socket_manager* m_sock_man;
#ifndef DHTSCAN_DISABLE_LOGGING
	dht_logger* m_log;
#endif
	dht_settings const& m_settings;
	routing_table& m_table;
	node_id m_our_id;
	int m_allocated_observers = 0;
	std::uint16_t m_next_transaction_id;
	bool m_destructing = false;
};

} // namespace dht
} // namespace dhtscan

#endif // DHTSCAN_RPC_MANAGER_HPP_INCLUDED
