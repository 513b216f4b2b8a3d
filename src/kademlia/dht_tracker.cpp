/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <functional>
#include <iterator>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "dhtscan/kademlia/dht_tracker.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/bencode.hpp"
#include "dhtscan/socket_io.hpp"
#include "dhtscan/version.hpp"

using namespace std::placeholders;

namespace dhtscan { namespace dht {

	// class that puts the networking and the kademlia node in a single
	// unit and connecting them together.
	dht_tracker::dht_tracker(dht_logger* log
		, io_context& ios
		, dht_settings const& settings)
		: m_log(log)
		, m_settings(settings)
		, m_socket(ios)
		, m_dht(this, settings, generate_random_id(), log)
		, m_tick_timer(ios)
		, m_bootstrap_timer(ios)
		, m_host_resolver(ios)
	{}

	dht_tracker::~dht_tracker() = default;

	void dht_tracker::start(udp::endpoint const& listen)
	{
		error_code ec;
		start(listen, ec);
		if (ec) throw system_error(ec);
	}

	void dht_tracker::start(udp::endpoint const& listen, error_code& ec)
	{
		m_socket.open(udp::v4(), ec);
		if (ec) return;

		m_socket.bind(listen, ec);
		if (ec)
		{
			error_code ignore;
			m_socket.close(ignore);
			return;
		}

		m_running = true;

#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::tracker))
		{
			m_log->log(dht_logger::tracker, "listening on %s"
				, print_endpoint(local_endpoint()).c_str());
		}
#endif

		start_receive();

		m_tick_timer.expires_after(milliseconds(200));
		m_tick_timer.async_wait(std::bind(&dht_tracker::tick, self(), _1));
	}

	void dht_tracker::stop()
	{
		m_running = false;

		// the traversals report back (as aborted) before the socket goes away
		m_dht.abort_traversals();

		m_tick_timer.cancel();
		m_bootstrap_timer.cancel();
		m_host_resolver.cancel();

		error_code ec;
		m_socket.close(ec);
#ifndef DHTSCAN_DISABLE_LOGGING
		if (ec && m_log != nullptr && m_log->should_log(dht_logger::tracker))
		{
			m_log->log(dht_logger::tracker, "failed to close socket: %s"
				, ec.message().c_str());
		}
#endif
	}

	udp::endpoint dht_tracker::local_endpoint() const
	{
		error_code ec;
		udp::endpoint const ret = m_socket.local_endpoint(ec);
		if (ec) return udp::endpoint();
		return ret;
	}

	void dht_tracker::add_router_node(udp::endpoint const& node)
	{
		m_dht.add_router_node(node);
	}

	void dht_tracker::bootstrap(std::vector<std::pair<std::string, int>> const& routers
		, time_duration const timeout, bootstrap_callback f)
	{
		m_bootstrap_callback = std::move(f);
		m_bootstrap_deadline = clock_type::now() + timeout;
		m_bootstrap_started = false;

		for (auto const& r : routers)
		{
			// numeric addresses don't need the resolver
			error_code ec;
			address const a = make_address(r.first, ec);
			if (!ec)
			{
				if (a.is_v4()) add_router_node(udp::endpoint(a, std::uint16_t(r.second)));
				continue;
			}

			++m_outstanding_resolves;
			std::string const host = r.first;
			m_host_resolver.async_resolve(udp::v4(), host, std::to_string(r.second)
				, std::bind(&dht_tracker::on_name_lookup, self(), _1, _2, host));
		}

		if (m_outstanding_resolves == 0)
		{
			start_bootstrap();
			return;
		}

		// names that never resolve must not hold up the bootstrap
		m_bootstrap_timer.expires_at(m_bootstrap_deadline);
		m_bootstrap_timer.async_wait(std::bind(&dht_tracker::on_bootstrap_timeout, self(), _1));
	}

	void dht_tracker::on_name_lookup(error_code const& e
		, udp::resolver::results_type const& results, std::string const& host)
	{
		--m_outstanding_resolves;
		if (e == boost::asio::error::operation_aborted || !m_running) return;

		if (e)
		{
#ifndef DHTSCAN_DISABLE_LOGGING
			if (m_log != nullptr && m_log->should_log(dht_logger::tracker))
			{
				m_log->log(dht_logger::tracker, "failed to resolve router %s: %s"
					, host.c_str(), e.message().c_str());
			}
#endif
		}
		else
		{
			auto const it = std::find_if(results.begin(), results.end()
				, [](udp::resolver::results_type::value_type const& r)
				{ return r.endpoint().address().is_v4(); });
			if (it != results.end()) add_router_node(it->endpoint());
		}

#ifdef DHTSCAN_DISABLE_LOGGING
		static_cast<void>(host);
#endif

		if (m_outstanding_resolves == 0) start_bootstrap();
	}

	void dht_tracker::on_bootstrap_timeout(error_code const& e)
	{
		if (e || !m_running || m_bootstrap_started) return;

#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::tracker))
		{
			m_log->log(dht_logger::tracker, "router name lookups timed out, %d still pending"
				, m_outstanding_resolves);
		}
#endif
		m_host_resolver.cancel();
		start_bootstrap();
	}

	void dht_tracker::start_bootstrap()
	{
		if (m_bootstrap_started) return;
		m_bootstrap_started = true;
		m_bootstrap_timer.cancel();

		int const num_routers = int(std::distance(m_dht.m_table.begin(), m_dht.m_table.end()));
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::tracker))
		{
			m_log->log(dht_logger::tracker, "bootstrapping with %d router nodes"
				, num_routers);
		}
#endif
		if (num_routers == 0 && m_dht.m_table.size() == 0)
		{
			// there is nothing to bootstrap from
			bootstrap_done(traversal_status::converged);
			return;
		}

		auto me = self();
		m_dht.bootstrap(m_bootstrap_deadline
			, [me](traversal_status const s) { me->bootstrap_done(s); });
	}

	void dht_tracker::bootstrap_done(traversal_status const s)
	{
		bootstrap_callback cb = std::move(m_bootstrap_callback);
		m_bootstrap_callback = nullptr;

		int const nodes = m_dht.m_table.size();
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::tracker))
		{
			m_log->log(dht_logger::tracker, "bootstrap %s, routing table holds %d nodes"
				, status_name(s), nodes);
		}
#else
		static_cast<void>(s);
#endif
		if (cb) cb(nodes);
	}

	std::shared_ptr<dht::get_peers> dht_tracker::get_peers(sha1_hash const& ih
		, time_point const deadline
		, dht::get_peers::data_callback dcallback
		, dht::get_peers::done_callback ncallback)
	{
		return m_dht.get_peers(ih, deadline, std::move(dcallback), std::move(ncallback));
	}

	void dht_tracker::abort_lookups()
	{
		m_dht.abort_traversals();
	}

	void dht_tracker::tick(error_code const& e)
	{
		if (e || !m_running) return;

		time_duration d = m_dht.tick(clock_type::now());

		// the traversal deadlines are checked here too, they need a finer
		// granularity than the query timeouts
		d = std::min(d, time_duration(milliseconds(250)));

		m_tick_timer.expires_after(d);
		m_tick_timer.async_wait(std::bind(&dht_tracker::tick, self(), _1));
	}

	void dht_tracker::start_receive()
	{
		m_socket.async_receive_from(boost::asio::buffer(m_recv_buf), m_remote
			, std::bind(&dht_tracker::on_receive, self(), _1, _2));
	}

	void dht_tracker::on_receive(error_code const& e, std::size_t const bytes_transferred)
	{
		if (!m_running || e == boost::asio::error::operation_aborted) return;

		if (e)
		{
			// ICMP errors from earlier sends show up here (connection
			// refused). They don't affect the socket itself
#ifndef DHTSCAN_DISABLE_LOGGING
			if (m_log != nullptr && m_log->should_log(dht_logger::tracker))
			{
				m_log->log(dht_logger::tracker, "receive error: %s"
					, e.message().c_str());
			}
#endif
			start_receive();
			return;
		}

		incoming_packet(m_remote, {m_recv_buf.data(), std::ptrdiff_t(bytes_transferred)});
		start_receive();
	}

	bool dht_tracker::incoming_packet(udp::endpoint const& ep, span<char const> const buf)
	{
		int const buf_size = int(buf.size());
		if (buf_size <= 20
			|| buf.front() != 'd'
			|| buf.back() != 'e') return false;

		if (!ep.address().is_v4()) return false;

#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr)
			m_log->log_packet(dht_logger::incoming_message, buf, ep);
#endif

		m_dht.incoming(ep, buf);
		return true;
	}

	bool dht_tracker::send_packet(entry& e, udp::endpoint const& addr)
	{
		static_assert(version_minor < 16, "version number not supported by DHT");
		static_assert(version_tiny < 16, "version number not supported by DHT");
		static char const ver[] = {'D', 'S'
			, char(version_major), char((version_minor << 4) | version_tiny)};
		e["v"] = std::string(ver, ver + 4);

		m_send_buf.clear();
		bencode(std::back_inserter(m_send_buf), e);

		error_code ec;
		if (!m_socket.is_open())
			ec = boost::asio::error::bad_descriptor;
		else
			m_socket.send_to(boost::asio::buffer(m_send_buf), addr, 0, ec);

		if (ec)
		{
#ifndef DHTSCAN_DISABLE_LOGGING
			if (m_log != nullptr && m_log->should_log(dht_logger::tracker))
			{
				m_log->log(dht_logger::tracker, "failed to send to %s: %s"
					, print_endpoint(addr).c_str(), ec.message().c_str());
			}
#endif
			return false;
		}

#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr)
			m_log->log_packet(dht_logger::outgoing_message, m_send_buf, addr);
#endif
		return true;
	}

}}
