/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_DHT_TRACKER_HPP_INCLUDED
#define DHTSCAN_DHT_TRACKER_HPP_INCLUDED

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dhtscan/config.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/span.hpp"
#include "dhtscan/time.hpp"
#include "dhtscan/error_code.hpp"
#include "dhtscan/kademlia/node.hpp"

namespace dhtscan { namespace dht {

	struct dht_logger;
	struct dht_settings;

	// owns the UDP socket the DHT node talks through. Everything happens on
	// the thread running the io_context the tracker was created with
	struct DHTSCAN_EXTRA_EXPORT dht_tracker final
		: socket_manager
		, std::enable_shared_from_this<dht_tracker>
	{
		// called with the number of nodes in the routing table once
		// bootstrapping ends
		using bootstrap_callback = std::function<void(int)>;

		dht_tracker(dht_logger* log
			, io_context& ios
			, dht_settings const& settings);
		virtual ~dht_tracker();

		dht_tracker(dht_tracker const&) = delete;
		dht_tracker& operator=(dht_tracker const&) = delete;

		// opens and binds the socket and starts receiving. The throwing
		// version throws system_error if the socket can't be bound
		void start(udp::endpoint const& listen);
		void start(udp::endpoint const& listen, error_code& ec);

		// aborts the running traversals and closes the socket. The handlers
		// still queued on the io_context hold a reference to the tracker, it
		// goes away once they have run
		void stop();

		// resolves the router names (IPv4 only) and bootstraps from them. The
		// callback is called once, whether or not any router answered
		void bootstrap(std::vector<std::pair<std::string, int>> const& routers
			, time_duration timeout, bootstrap_callback f);

		void add_router_node(udp::endpoint const& node);

		std::shared_ptr<dht::get_peers> get_peers(sha1_hash const& ih
			, time_point deadline
			, dht::get_peers::data_callback dcallback
			, dht::get_peers::done_callback ncallback);

		// ends every running lookup with the aborted status
		void abort_lookups();

		int num_nodes() const { return m_dht.m_table.size(); }

		udp::endpoint local_endpoint() const;

		bool incoming_packet(udp::endpoint const& ep, span<char const> buf);

	private:

		std::shared_ptr<dht_tracker> self()
		{ return shared_from_this(); }

		void start_receive();
		void on_receive(error_code const& e, std::size_t bytes_transferred);
		void tick(error_code const& e);
		void on_name_lookup(error_code const& e
			, udp::resolver::results_type const& results, std::string const& host);
		void on_bootstrap_timeout(error_code const& e);
		void start_bootstrap();
		void bootstrap_done(traversal_status s);

		// implements socket_manager
		bool send_packet(entry& e, udp::endpoint const& addr) override;

		dht_logger* m_log;
		dht_settings const& m_settings;

		udp::socket m_socket;

		node m_dht;

		std::array<char, 2048> m_recv_buf;
		udp::endpoint m_remote;

		std::vector<char> m_send_buf;

		deadline_timer m_tick_timer;
		deadline_timer m_bootstrap_timer;

		// used to resolve hostnames for router nodes
		udp::resolver m_host_resolver;

		bootstrap_callback m_bootstrap_callback;
		time_point m_bootstrap_deadline;
		int m_outstanding_resolves = 0;
		bool m_bootstrap_started = false;

		bool m_running = false;
	};

}}

#endif // DHTSCAN_DHT_TRACKER_HPP_INCLUDED
