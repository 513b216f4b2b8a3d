/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_SCANNER_HPP_INCLUDED
#define DHTSCAN_SCANNER_HPP_INCLUDED

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dhtscan/config.hpp"
#include "dhtscan/error_code.hpp"
#include "dhtscan/sha1_hash.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/time.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/kademlia/traversal_algorithm.hpp"

namespace dhtscan {

namespace dht {
	struct dht_logger;
	struct dht_tracker;
}

	// the settings of a scanner. The defaults match what a one-off scan
	// from the command line needs
	struct DHTSCAN_EXPORT scan_settings
	{
		// the IPv4 address to bind the DHT socket to
		std::string listen_interface = "0.0.0.0";

		// 0 picks any free port
		int listen_port = 0;

		// the routers to bootstrap from, as (host name, port). Host names are
		// resolved to IPv4 addresses
		std::vector<std::pair<std::string, int>> router_nodes = {
			{"router.bittorrent.com", 6881},
			{"dht.transmissionbt.com", 6881},
			{"router.utorrent.com", 6881}};

		// the longest time spent bootstrapping before lookups start
		time_duration bootstrap_timeout = seconds(10);

		// the number of info-hashes looked up at the same time
		int max_concurrent_lookups = 1;

		// how often the abort flag is polled while a scan is running
		time_duration tick_interval = milliseconds(100);

		dht::dht_settings dht;
	};

	// the peers found for one info-hash
	struct DHTSCAN_EXPORT info_hash_result
	{
		// the info-hash as it was passed to scan()
		std::string hex;
		sha1_hash info_hash;

		// sorted, without duplicates
		std::vector<tcp::endpoint> peers;

		// how the lookup ended. ``running`` means it never started
		dht::traversal_status status = dht::traversal_status::running;
	};

	struct DHTSCAN_EXPORT scan_result
	{
		// when the scan started
		std::chrono::system_clock::time_point date_crawling;

		// one entry per distinct info-hash, in the order they were passed in
		std::vector<info_hash_result> hashes;

		// the number of nodes in the routing table after bootstrapping
		int routing_table_size = 0;

		// true if the scan was stopped by scanner::abort(). Info-hashes whose
		// lookup never started are not in ``hashes``
		bool aborted = false;

		// returns nullptr if the info-hash was not scanned
		info_hash_result const* find(std::string const& hex) const;
	};

	// receives progress notifications while a scan is running. All calls
	// are made from within scanner::scan()
	struct DHTSCAN_EXPORT scan_observer
	{
		virtual void on_bootstrap_start() {}
		virtual void on_bootstrap_done(int /* routing_table_size */) {}
		virtual void on_lookup_start(info_hash_result const&) {}
		virtual void on_peer(info_hash_result const&, tcp::endpoint const&) {}
		virtual void on_lookup_done(info_hash_result const&) {}
		virtual void on_abort() {}

	protected:
		~scan_observer() = default;
	};

	// looks up the peers of a list of info-hashes on the DHT. The scanner runs
	// the io_context it's given on the thread calling scan()
	class DHTSCAN_EXPORT scanner
	{
	public:
		scanner(io_context& ios, scan_settings const& settings
			, dht::dht_logger* log = nullptr
			, scan_observer* observer = nullptr);
		~scanner();

		scanner(scanner const&) = delete;
		scanner& operator=(scanner const&) = delete;

		// looks up every info-hash (40 hex digits), spending at most ``budget``
		// on each. All hashes are validated before any network activity. The
		// first version throws system_error, the second sets ``ec``.
		scan_result scan(std::vector<std::string> const& hashes, time_duration budget);
		scan_result scan(std::vector<std::string> const& hashes, time_duration budget
			, error_code& ec);

		// stops a running scan (or the next one). Lookups in progress end
		// with the peers found so far. Only sets an atomic flag, so it may be
		// called from a signal handler or another thread
		void abort() { m_abort = true; }

		bool is_aborted() const { return m_abort; }

		scan_settings const& settings() const { return m_settings; }

	private:

		void on_bootstrapped(int num_nodes);
		void start_lookups();
		void on_lookup_done(std::size_t idx, std::vector<tcp::endpoint> const& peers
			, dht::traversal_status s);
		void check_abort(error_code const& e);
		void abort_scan();

		io_context& m_ios;
		scan_settings m_settings;
		dht::dht_logger* m_log;
		scan_observer* m_observer;

		std::atomic<bool> m_abort{false};

		deadline_timer m_abort_timer;

		// the state of the scan in progress
		std::shared_ptr<dht::dht_tracker> m_tracker;
		scan_result* m_result = nullptr;
		time_duration m_budget{};
		std::size_t m_next_lookup = 0;
		int m_running_lookups = 0;
		bool m_aborting = false;
		bool m_finished = false;
	};
}

#endif // DHTSCAN_SCANNER_HPP_INCLUDED
