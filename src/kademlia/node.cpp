/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <utility>

#include "dhtscan/kademlia/node.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/kademlia/traversal_algorithm.hpp"
#include "dhtscan/bdecode.hpp"
#include "dhtscan/random.hpp"
#include "dhtscan/socket_io.hpp"

#ifndef DHTSCAN_DISABLE_LOGGING
#include "dhtscan/hex.hpp" // to_hex
#endif

namespace dhtscan { namespace dht {

namespace {

// the k closest nodes we know of, in the "nodes" format
std::vector<node_endpoint> closest_nodes(routing_table const& table
	, node_id const& target)
{
	std::vector<node_endpoint> ret;
	for (auto const& n : table.find_node(target, {}, table.bucket_size()))
		ret.emplace_back(n.id, n.ep());
	return ret;
}

} // anonymous namespace

node::node(socket_manager* sock_man
	, dht_settings const& settings
	, node_id const& nid
	, dht_logger* log)
	: m_settings(settings)
	, m_id(nid)
	, m_table(m_id, settings.bucket_size, settings, log)
	, m_rpc(m_id, m_settings, m_table, sock_man, log)
	, m_sock_man(sock_man)
	, m_log(log)
{
	aux::random_bytes({reinterpret_cast<char*>(m_secret.data())
		, std::ptrdiff_t(m_secret.size())});

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::node))
	{
		m_log->log(dht_logger::node, "starting DHT node, id: %s"
			, aux::to_hex(m_id).c_str());
	}
#endif
}

node::~node() = default;

int node::branch_factor() const { return m_settings.search_branching; }

void node::add_router_node(udp::endpoint const& router)
{
#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::node))
	{
		m_log->log(dht_logger::node, "adding router node: %s"
			, print_endpoint(router).c_str());
	}
#endif
	m_table.add_router_node(router);
}

std::string node::generate_token(udp::endpoint const& addr) const
{
	address_v4::bytes_type const b = addr.address().to_v4().to_bytes();
	std::string token(m_secret.size(), '\0');
	for (std::size_t i = 0; i < m_secret.size(); ++i)
		token[i] = char(m_secret[i] ^ b[i]);
	return token;
}

void node::incoming(udp::endpoint const& ep, span<char const> buf)
{
	error_code ec;
	int pos = 0;
	entry const e = bdecode(buf, ec, &pos);
	if (ec)
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::node))
		{
			m_log->log(dht_logger::node, "INVALID MESSAGE from %s: %s (at %d)"
				, print_endpoint(ep).c_str(), ec.message().c_str(), pos);
		}
#endif
		return;
	}

	message m;
	if (!read_message(e, m, ec))
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::node))
		{
			m_log->log(dht_logger::node, "INVALID KRPC MESSAGE from %s: %s"
				, print_endpoint(ep).c_str(), ec.message().c_str());
		}
#endif
		// only broken queries are answered. Answering a broken reply could
		// start an error ping-pong with the other node
		if (e.type() != entry::dictionary_t) return;
		entry const* y = e.find_key("y");
		entry const* t = e.find_key("t");
		if (y == nullptr || y->type() != entry::string_t || y->string() != "q"
			|| t == nullptr || t->type() != entry::string_t)
			return;

		error_message err;
		err.transaction_id = t->string();
		err.code = protocol_error;
		err.message = ec.message();
		send_reply(err, ep);
		return;
	}

	if (auto const* q = std::get_if<query_message>(&m))
	{
		// let the routing table know this node may exist
		m_table.heard_about(q->sender, ep);
		send_reply(incoming_request(*q, ep), ep);
		return;
	}

#ifndef DHTSCAN_DISABLE_LOGGING
	if (auto const* err = std::get_if<error_message>(&m))
	{
		if (m_log != nullptr && m_log->should_log(dht_logger::node))
		{
			m_log->log(dht_logger::node, "INCOMING ERROR: (%d) %s"
				, err->code, err->message.c_str());
		}
	}
#endif

	m_rpc.incoming(m, ep);
}

message node::incoming_request(query_message const& q, udp::endpoint const& from)
{
#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::node))
	{
		m_log->log(dht_logger::node, "INCOMING QUERY %s from %s"
			, q.method_name.c_str(), print_endpoint(from).c_str());
	}
#endif

	switch (q.method)
	{
		case query_method::ping:
		{
			response_message r;
			r.transaction_id = q.transaction_id;
			r.sender = m_id;
			return r;
		}
		case query_method::find_node:
		{
			response_message r;
			r.transaction_id = q.transaction_id;
			r.sender = m_id;
			r.nodes = closest_nodes(m_table, q.target);
			return r;
		}
		case query_method::get_peers:
		{
			// we don't store any peers, the best we can do is to point the
			// requester closer to the info-hash
			response_message r;
			r.transaction_id = q.transaction_id;
			r.sender = m_id;
			r.nodes = closest_nodes(m_table, q.target);
			r.token = generate_token(from);
			return r;
		}
		case query_method::announce_peer:
		case query_method::unknown:
			break;
	}

	error_message err;
	err.transaction_id = q.transaction_id;
	err.code = method_unknown;
	err.message = "Method Unknown";
	return err;
}

void node::send_reply(message const& m, udp::endpoint const& to)
{
	entry e;
	write_message(m, e);
	if (m_sock_man->send_packet(e, to)) return;

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::node))
	{
		m_log->log(dht_logger::node, "failed to send reply to %s"
			, print_endpoint(to).c_str());
	}
#endif
}

std::vector<std::shared_ptr<traversal_algorithm>> node::running_traversals() const
{
	std::vector<std::shared_ptr<traversal_algorithm>> ret;
	ret.reserve(m_running_requests.size());
	for (auto* t : m_running_requests)
	{
		// a traversal being destructed is still in the set, but can't be
		// locked anymore
		std::shared_ptr<traversal_algorithm> p = t->weak_from_this().lock();
		if (p) ret.push_back(std::move(p));
	}
	return ret;
}

time_duration node::tick(time_point const now)
{
	time_duration const next = m_rpc.tick(now);

	for (auto const& t : running_traversals())
		t->tick(now);

	return next;
}

void node::abort_traversals()
{
	for (auto const& t : running_traversals())
		t->abort();
}

std::shared_ptr<dht::bootstrap> node::bootstrap(time_point const deadline
	, dht::bootstrap::done_callback f)
{
	auto r = std::make_shared<dht::bootstrap>(*this, m_id, std::move(f));
	r->set_deadline(deadline);
	r->start();
	return r;
}

std::shared_ptr<dht::get_peers> node::get_peers(sha1_hash const& info_hash
	, time_point const deadline
	, dht::get_peers::data_callback dcallback
	, dht::get_peers::done_callback ncallback)
{
	auto ta = std::make_shared<dht::get_peers>(*this, info_hash
		, std::move(dcallback), std::move(ncallback));
	ta->set_deadline(deadline);
	ta->start();
	return ta;
}

} } // namespace dhtscan::dht
