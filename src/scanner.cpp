/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <functional>

#include <boost/asio/post.hpp>

#include "dhtscan/scanner.hpp"
#include "dhtscan/kademlia/dht_tracker.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/socket_io.hpp"

using namespace std::placeholders;

namespace dhtscan {

	info_hash_result const* scan_result::find(std::string const& hex) const
	{
		auto const i = std::find_if(hashes.begin(), hashes.end()
			, [&](info_hash_result const& r) { return r.hex == hex; });
		if (i == hashes.end()) return nullptr;
		return &*i;
	}

	scanner::scanner(io_context& ios, scan_settings const& settings
		, dht::dht_logger* log
		, scan_observer* observer)
		: m_ios(ios)
		, m_settings(settings)
		, m_log(log)
		, m_observer(observer)
		, m_abort_timer(ios)
	{}

	scanner::~scanner() = default;

	scan_result scanner::scan(std::vector<std::string> const& hashes
		, time_duration const budget)
	{
		// report the offending hash, not just the error
		for (auto const& h : hashes)
		{
			sha1_hash ih;
			if (!parse_info_hash(h, ih))
				throw system_error(errors::invalid_info_hash, h);
		}

		error_code ec;
		scan_result ret = scan(hashes, budget, ec);
		if (ec) throw system_error(ec);
		return ret;
	}

	scan_result scanner::scan(std::vector<std::string> const& hashes
		, time_duration const budget, error_code& ec)
	{
		ec.clear();
		scan_result ret;

		for (auto const& h : hashes)
		{
			info_hash_result r;
			if (!parse_info_hash(h, r.info_hash))
			{
				ec = errors::invalid_info_hash;
				ret.hashes.clear();
				return ret;
			}

			// the same info-hash is only looked up once, under the spelling
			// it was first given
			if (std::any_of(ret.hashes.begin(), ret.hashes.end()
				, [&](info_hash_result const& e) { return e.info_hash == r.info_hash; }))
				continue;

			r.hex = h;
			ret.hashes.push_back(std::move(r));
		}

		address const listen_addr = make_address(m_settings.listen_interface, ec);
		if (ec) return ret;

		ret.date_crawling = std::chrono::system_clock::now();

		auto tracker = std::make_shared<dht::dht_tracker>(m_log, m_ios, m_settings.dht);
		tracker->start(udp::endpoint(listen_addr, std::uint16_t(m_settings.listen_port)), ec);
		if (ec) return ret;

		// a previous run may have left the io_context stopped
		m_ios.restart();

		m_tracker = tracker;
		m_result = &ret;
		m_budget = budget;
		m_next_lookup = 0;
		m_running_lookups = 0;
		m_aborting = false;
		m_finished = false;

		m_abort_timer.expires_after(m_settings.tick_interval);
		m_abort_timer.async_wait(std::bind(&scanner::check_abort, this, _1));

		if (m_observer != nullptr) m_observer->on_bootstrap_start();
		m_tracker->bootstrap(m_settings.router_nodes, m_settings.bootstrap_timeout
			, std::bind(&scanner::on_bootstrapped, this, _1));

		while (!m_finished)
		{
			if (m_ios.run_one() == 0) break;
		}
		m_finished = true;

		m_abort_timer.cancel();
		m_tracker->stop();
		m_tracker.reset();

		// let the cancelled operations complete, they hold references to the
		// tracker and to this object
		m_ios.restart();
		m_ios.poll();

		m_result = nullptr;

		if (ret.aborted)
		{
			// the lookups that never started are not part of the result
			ret.hashes.erase(std::remove_if(ret.hashes.begin(), ret.hashes.end()
				, [](info_hash_result const& r)
				{ return r.status == dht::traversal_status::running; })
				, ret.hashes.end());
		}

		return ret;
	}

	void scanner::on_bootstrapped(int const num_nodes)
	{
		if (m_finished || m_result == nullptr) return;

		m_result->routing_table_size = num_nodes;

#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht::dht_logger::scanner))
		{
			if (num_nodes == 0)
			{
				m_log->log(dht::dht_logger::scanner
					, "WARNING: no DHT nodes could be reached, lookups will only ask the routers");
			}
			else
			{
				m_log->log(dht::dht_logger::scanner, "bootstrapped with %d nodes", num_nodes);
			}
		}
#endif

		if (m_observer != nullptr) m_observer->on_bootstrap_done(num_nodes);

		start_lookups();
	}

	void scanner::start_lookups()
	{
		if (m_finished || m_aborting || m_result == nullptr) return;

		std::vector<info_hash_result>& hashes = m_result->hashes;
		int const max_lookups = std::max(1, m_settings.max_concurrent_lookups);

		while (m_running_lookups < max_lookups && m_next_lookup < hashes.size())
		{
			std::size_t const idx = m_next_lookup++;
			info_hash_result& r = hashes[idx];

#ifndef DHTSCAN_DISABLE_LOGGING
			if (m_log != nullptr && m_log->should_log(dht::dht_logger::scanner))
			{
				m_log->log(dht::dht_logger::scanner, "starting lookup %d of %d: %s"
					, int(idx + 1), int(hashes.size()), r.hex.c_str());
			}
#endif
			if (m_observer != nullptr) m_observer->on_lookup_start(r);

			++m_running_lookups;
			m_tracker->get_peers(r.info_hash, clock_type::now() + m_budget
				, [this, idx](std::vector<tcp::endpoint> const& peers)
				{
					if (m_observer == nullptr || m_result == nullptr) return;
					for (auto const& p : peers)
						m_observer->on_peer(m_result->hashes[idx], p);
				}
				, [this, idx](std::vector<tcp::endpoint> const& peers
					, dht::traversal_status const s)
				{ on_lookup_done(idx, peers, s); });
		}

		if (m_running_lookups == 0 && m_next_lookup >= hashes.size())
			m_finished = true;
	}

	void scanner::on_lookup_done(std::size_t const idx
		, std::vector<tcp::endpoint> const& peers
		, dht::traversal_status const s)
	{
		--m_running_lookups;
		if (m_result == nullptr) return;

		info_hash_result& r = m_result->hashes[idx];
		r.peers = peers;
		r.status = s;

#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht::dht_logger::scanner))
		{
			m_log->log(dht::dht_logger::scanner, "lookup %s %s with %d peers"
				, r.hex.c_str(), dht::status_name(s), int(r.peers.size()));
		}
#endif
		if (m_observer != nullptr) m_observer->on_lookup_done(r);

		if (m_aborting || m_finished) return;

		// the next lookup is started from the io_context rather than from
		// within the traversal that just ended
		boost::asio::post(m_ios, std::bind(&scanner::start_lookups, this));
	}

	void scanner::check_abort(error_code const& e)
	{
		if (e || m_finished) return;

		if (m_abort)
		{
			abort_scan();
			return;
		}

		m_abort_timer.expires_after(m_settings.tick_interval);
		m_abort_timer.async_wait(std::bind(&scanner::check_abort, this, _1));
	}

	void scanner::abort_scan()
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht::dht_logger::scanner))
		{
			m_log->log(dht::dht_logger::scanner, "scan aborted, %d lookups running"
				, m_running_lookups);
		}
#endif
		m_aborting = true;
		m_result->aborted = true;
		if (m_observer != nullptr) m_observer->on_abort();

		// the running lookups report what they have found so far, from
		// within this call
		m_tracker->abort_lookups();
		m_finished = true;
	}
}
