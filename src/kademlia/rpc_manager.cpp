/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <vector>
#include <iterator>
#include <algorithm>
#include <cinttypes> // for PRId64 et.al.

#include "dhtscan/kademlia/rpc_manager.hpp"
#include "dhtscan/kademlia/routing_table.hpp"
#include "dhtscan/kademlia/node.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/kademlia/traversal_algorithm.hpp"
#include "dhtscan/random.hpp"
#include "dhtscan/hex.hpp"
#include "dhtscan/io.hpp"
#include "dhtscan/socket_io.hpp"
#include "dhtscan/assert.hpp"

namespace dhtscan { namespace dht {

dht_logger* observer::get_logger() const
{
	return m_algorithm->get_node().logger();
}

void observer::set_target(udp::endpoint const& ep)
{
	m_sent = clock_type::now();

	m_port = ep.port();
	DHTSCAN_ASSERT(ep.address().is_v4());
	m_addr = ep.address().to_v4().to_bytes();
}

address observer::target_addr() const
{
	return address_v4(m_addr);
}

udp::endpoint observer::target_ep() const
{
	return udp::endpoint(target_addr(), m_port);
}

void observer::abort()
{
	flags |= flag_done;
}

void observer::done()
{
	if (flags & flag_done) return;
	flags |= flag_done;
	m_algorithm->finished(self());
}

void observer::timeout()
{
	if (flags & flag_done) return;
	flags |= flag_done;
	m_algorithm->failed(self());
}

void observer::set_id(node_id const& id)
{
	if (m_id == id) return;
	m_id = id;
	if (m_algorithm) m_algorithm->resort_result(this);
}

observer::~observer()
{
	// if the message was sent, it must have been
	// reported back to the traversal_algorithm as
	// well. If it wasn't sent, it cannot have been
	// reported back
	DHTSCAN_ASSERT(bool(flags & flag_queried) == bool(flags & flag_done)
		|| !(flags & flag_queried));
}

rpc_manager::rpc_manager(node_id const& our_id
	, dht_settings const& settings
	, routing_table& table
	, socket_manager* sock_man
	, dht_logger* log)
	: m_pool_allocator(observer_size, 10)
	, m_sock_man(sock_man)
#ifndef DHTSCAN_DISABLE_LOGGING
	, m_log(log)
#endif
	, m_settings(settings)
	, m_table(table)
	, m_our_id(our_id)
	, m_next_transaction_id(std::uint16_t(random(0xffff)))
{
#ifdef DHTSCAN_DISABLE_LOGGING
	static_cast<void>(log);
#endif
}

rpc_manager::~rpc_manager()
{
	DHTSCAN_ASSERT(!m_destructing);
	m_destructing = true;

	for (auto const& t : m_transactions)
		t.second->abort();
	m_transactions.clear();
}

void* rpc_manager::allocate_observer()
{
	m_pool_allocator.set_next_size(10);
	void* ret = m_pool_allocator.malloc();
	if (ret != nullptr) ++m_allocated_observers;
	return ret;
}

void rpc_manager::free_observer(void* ptr)
{
	if (ptr == nullptr) return;
	--m_allocated_observers;
	DHTSCAN_ASSERT(m_allocated_observers >= 0);
	m_pool_allocator.free(ptr);
}

std::uint16_t rpc_manager::next_transaction_id()
{
	// the ID space is far larger than the number of queries in flight, the
	// loop only ever skips a handful of IDs
	std::uint16_t tid = m_next_transaction_id++;
	while (m_transactions.count(tid) > 0) tid = m_next_transaction_id++;
	return tid;
}

bool rpc_manager::incoming(message const& m, udp::endpoint const& from)
{
	if (m_destructing) return false;

	DHTSCAN_ASSERT(!std::holds_alternative<query_message>(m));

	std::string const& tid_str = transaction_id(m);
	if (tid_str.size() != 2)
	{
		// we only ever send 2 byte transaction IDs, this can't be
		// the answer to anything we sent
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::rpc_manager))
		{
			m_log->log(dht_logger::rpc_manager, "reply with unknown transaction id size: %d from %s"
				, int(tid_str.size()), print_endpoint(from).c_str());
		}
#endif
		return false;
	}

	char const* ptr = tid_str.data();
	std::uint16_t const tid = detail::read_uint16(ptr);

	auto const i = m_transactions.find(tid);
	if (i == m_transactions.end() || i->second->target_addr() != from.address())
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::rpc_manager))
		{
			m_log->log(dht_logger::rpc_manager, "reply with invalid transaction id: %d from %s"
				, int(tid), print_endpoint(from).c_str());
		}
#endif
		return false;
	}

	observer_ptr o = i->second;
	m_transactions.erase(i);

	time_point const now = clock_type::now();

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::rpc_manager))
	{
		m_log->log(dht_logger::rpc_manager, "[%u] round trip time(ms): %" PRId64 " from %s"
			, o->algorithm()->id(), total_milliseconds(now - o->sent())
			, print_endpoint(from).c_str());
	}
#endif

	if (auto const* err = std::get_if<error_message>(&m))
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::rpc_manager))
		{
			m_log->log(dht_logger::rpc_manager, "[%u] reply with error from %s: (%d) %s"
				, o->algorithm()->id(), print_endpoint(from).c_str()
				, err->code, err->message.c_str());
		}
#else
		static_cast<void>(err);
#endif
		// an error reply counts as a failure of the query
		o->timeout();
		return false;
	}

	response_message const& r = std::get<response_message>(m);

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::rpc_manager))
	{
		m_log->log(dht_logger::rpc_manager, "[%u] reply with transaction id: %d from %s"
			, o->algorithm()->id(), int(tid), print_endpoint(from).c_str());
	}
#endif

	// the routing table learns about the node before the traversal sees the
	// reply, so nodes it references are matched against a fresh table
	m_table.node_seen(r.sender, from, int(total_milliseconds(now - o->sent())));
	o->reply(msg(r, from));
	return true;
}

time_duration rpc_manager::tick(time_point const now)
{
	time_duration ret = seconds(1);

	std::vector<observer_ptr> timeouts;

	for (auto i = m_transactions.begin(); i != m_transactions.end();)
	{
		observer_ptr const& o = i->second;

		time_duration const diff = now - o->sent();
		if (diff >= m_settings.query_timeout)
		{
#ifndef DHTSCAN_DISABLE_LOGGING
			if (m_log != nullptr && m_log->should_log(dht_logger::rpc_manager))
			{
				m_log->log(dht_logger::rpc_manager, "[%u] timing out transaction id: %d from: %s"
					, o->algorithm()->id(), int(i->first)
					, print_endpoint(o->target_ep()).c_str());
			}
#endif
			timeouts.push_back(o);
			i = m_transactions.erase(i);
			continue;
		}

		ret = std::min(ret, m_settings.query_timeout - diff);
		++i;
	}

	// the observers are told after the transaction table is done being
	// iterated, since timing out may cause new queries to be sent
	for (auto const& o : timeouts)
		o->timeout();

	return std::max(ret, time_duration(milliseconds(200)));
}

bool rpc_manager::invoke(query_message& q, udp::endpoint const& target
	, observer_ptr o)
{
	DHTSCAN_ASSERT(o);
	if (m_destructing) return false;

	std::uint16_t const tid = next_transaction_id();
	q.transaction_id.clear();
	auto out = std::back_inserter(q.transaction_id);
	detail::write_uint16(tid, out);
	q.sender = m_our_id;

	o->set_target(target);

	entry e;
	write_message(q, e);

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::rpc_manager))
	{
		m_log->log(dht_logger::rpc_manager, "[%u] invoking %s -> %s"
			, o->algorithm()->id(), method_name(q.method)
			, print_endpoint(target).c_str());
	}
#endif

	if (!m_sock_man->send_packet(e, target)) return false;

	m_transactions[tid] = std::move(o);
	return true;
}

} } // namespace dhtscan::dht
