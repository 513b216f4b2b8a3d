/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_NODE_HPP
#define DHTSCAN_NODE_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "dhtscan/config.hpp"
#include "dhtscan/entry.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/span.hpp"
#include "dhtscan/time.hpp"
#include "dhtscan/sha1_hash.hpp"
#include "dhtscan/kademlia/node_id.hpp"
#include "dhtscan/kademlia/msg.hpp"
#include "dhtscan/kademlia/routing_table.hpp"
#include "dhtscan/kademlia/rpc_manager.hpp"
#include "dhtscan/kademlia/get_peers.hpp"
#include "dhtscan/kademlia/bootstrap.hpp"

namespace dhtscan {
namespace dht {

struct traversal_algorithm;
struct dht_logger;
struct dht_settings;

// where the node sends its packets. The tracker implements it on top of the
// UDP socket, tests implement it to capture what would have been sent
struct socket_manager
{
	// bencodes ``e`` (adding the client version) and sends it. Returns
	// false if the packet could not be sent
	virtual bool send_packet(entry& e, udp::endpoint const& addr) = 0;
protected:
	~socket_manager() = default;
};

// the DHT node. It owns the routing table and the rpc_manager, answers
// incoming queries and starts traversals
class DHTSCAN_EXTRA_EXPORT node
{
public:
	node(socket_manager* sock_man
		, dht_settings const& settings
		, node_id const& nid
		, dht_logger* log);

	~node();

	node(node const&) = delete;
	node& operator=(node const&) = delete;
	node(node&&) = delete;
	node& operator=(node&&) = delete;

	// times out queries and enforces traversal deadlines. Returns the time
	// until the next query may time out
	time_duration tick(time_point now);

	// looks up our own ID starting from the router nodes, to fill the
	// routing table
	std::shared_ptr<dht::bootstrap> bootstrap(time_point deadline
		, dht::bootstrap::done_callback f);

	void add_router_node(udp::endpoint const& router);

	// handles one datagram received on the socket
	void incoming(udp::endpoint const& ep, span<char const> buf);

	std::shared_ptr<dht::get_peers> get_peers(sha1_hash const& info_hash
		, time_point deadline
		, dht::get_peers::data_callback dcallback
		, dht::get_peers::done_callback ncallback);

	// ends every running traversal with the aborted status
	void abort_traversals();

	int num_running_traversals() const { return int(m_running_requests.size()); }

	node_id const& nid() const { return m_id; }

	std::uint32_t search_id() { return m_search_id++; }

	// the write token handed out in get_peers replies
	std::string generate_token(udp::endpoint const& addr) const;

	int branch_factor() const;

	void add_traversal_algorithm(traversal_algorithm* a)
	{
		m_running_requests.insert(a);
	}

	void remove_traversal_algorithm(traversal_algorithm* a)
	{
		m_running_requests.erase(a);
	}

	dht_settings const& settings() const { return m_settings; }

	dht_logger* logger() const { return m_log; }

private:

	message incoming_request(query_message const& q, udp::endpoint const& from);

	void send_reply(message const& m, udp::endpoint const& to);

	// the running traversals, strong references taken before calling into
	// them, since a call may end (and release) the traversal
	std::vector<std::shared_ptr<traversal_algorithm>> running_traversals() const;

	dht_settings const& m_settings;

	node_id m_id;

	// this list must be destructed after the rpc manager
	// since it might have references to it
	std::set<traversal_algorithm*> m_running_requests;

public:
	routing_table m_table;
	rpc_manager m_rpc;

private:

	socket_manager* m_sock_man;

	dht_logger* m_log;

	std::uint32_t m_search_id = 0;

	// secret random number used to create write tokens
	std::array<std::uint8_t, 4> m_secret;
};

} // namespace dht
} // namespace dhtscan

#endif // DHTSCAN_NODE_HPP
