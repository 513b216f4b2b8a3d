/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <functional>
#include <numeric>

#include "dhtscan/kademlia/routing_table.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"
#include "dhtscan/kademlia/dht_settings.hpp"
#include "dhtscan/assert.hpp"
#include "dhtscan/hex.hpp" // to_hex
#include "dhtscan/socket_io.hpp" // for print_endpoint

namespace dhtscan { namespace dht {

constexpr find_nodes_flags_t routing_table::include_failed;

routing_table::routing_table(node_id const& id, int const bucket_size
	, dht_settings const& settings
	, dht_logger* log)
	:
#ifndef DHTSCAN_DISABLE_LOGGING
	m_log(log),
#endif
	m_settings(settings)
	, m_id(id)
	, m_bucket_size(bucket_size)
{
#ifdef DHTSCAN_DISABLE_LOGGING
	static_cast<void>(log);
#endif
	// bucket 0 covers the whole id space until it's split
	m_buckets.reserve(30);
	m_buckets.emplace_back();
}

int routing_table::size() const
{
	return std::accumulate(m_buckets.begin(), m_buckets.end(), 0
		, [](int const acc, routing_table_node const& b)
		{ return acc + int(b.live_nodes.size()); });
}

int routing_table::num_confirmed_nodes() const
{
	int ret = 0;
	for (auto const& b : m_buckets)
	{
		ret += int(std::count_if(b.live_nodes.begin(), b.live_nodes.end()
			, [](node_entry const& k) { return k.confirmed(); }));
	}
	return ret;
}

int routing_table::bucket_index(node_id const& id) const
{
	int const num_buckets = int(m_buckets.size());
	// the number of leading bits the id shares with ours
	int const shared = 159 - distance_exp(m_id, id);
	return std::min(shared, num_buckets - 1);
}

routing_table::table_t::iterator routing_table::find_bucket(node_id const& id)
{
	return m_buckets.begin() + bucket_index(id);
}

node_entry* routing_table::find_entry(node_id const& id)
{
	bucket_t& b = find_bucket(id)->live_nodes;
	auto const j = std::find_if(b.begin(), b.end()
		, [&id](node_entry const& ne) { return ne.id == id; });
	return j == b.end() ? nullptr : &*j;
}

node_entry const* routing_table::find_node(node_id const& id) const
{
	bucket_t const& b = m_buckets[std::size_t(bucket_index(id))].live_nodes;
	auto const j = std::find_if(b.begin(), b.end()
		, [&id](node_entry const& ne) { return ne.id == id; });
	return j == b.end() ? nullptr : &*j;
}

bool routing_table::add_node(node_entry const& e)
{
	for (;;)
	{
		add_node_status_t const s = add_node_impl(e);
		if (s == failed_to_add) return false;
		if (s == node_added) return true;
		DHTSCAN_ASSERT(s == need_bucket_split);

		split_bucket();

#if DHTSCAN_USE_ASSERTS
		check_invariant();
#endif
	}
}

routing_table::add_node_status_t routing_table::add_node_impl(node_entry e)
{
	// don't add ourself
	if (e.id == m_id) return failed_to_add;

	// if the node is a router, don't add it to the buckets, router nodes are
	// only used to start lookups
	if (m_router_nodes.find(e.ep()) != m_router_nodes.end()) return failed_to_add;

	auto const i = find_bucket(e.id);
	bucket_t& b = i->live_nodes;
	bool const last_bucket = (i + 1) == m_buckets.end();

	auto j = std::find_if(b.begin(), b.end()
		, [&e](node_entry const& ne) { return ne.id == e.id; });

	if (j != b.end())
	{
		if (j->ep() != e.ep())
		{
			// a node we know is alive under this ID is not replaced by
			// whoever else claims it
			if (j->confirmed())
			{
#ifndef DHTSCAN_DISABLE_LOGGING
				if (m_log != nullptr && m_log->should_log(dht_logger::routing_table))
				{
					m_log->log(dht_logger::routing_table
						, "ignoring node (id already in use): id: %s new-addr: %s existing-addr: %s"
						, aux::to_hex(e.id).c_str(), print_endpoint(e.ep()).c_str()
						, print_endpoint(j->ep()).c_str());
				}
#endif
				return failed_to_add;
			}
			j->endpoint = e.endpoint;
		}

		if (e.pinged())
		{
			j->verified = true;
			j->reset_fail_count();
			j->last_seen = e.last_seen;
		}
		j->update_rtt(e.rtt);
		return node_added;
	}

	if (int(b.size()) < m_bucket_size)
	{
		b.push_back(e);
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::routing_table))
		{
			m_log->log(dht_logger::routing_table, "inserting node: %s %s bucket: %d size: %d"
				, aux::to_hex(e.id).c_str(), print_endpoint(e.ep()).c_str()
				, int(i - m_buckets.begin()), int(b.size()));
		}
#endif
		return node_added;
	}

	// the bucket covering our own ID may be split, until there are 160
	// buckets (at that point each bucket holds the nodes sharing exactly
	// one prefix length with us)
	if (last_bucket && int(m_buckets.size()) < 160)
		return need_bucket_split;

	// the bucket is full and can't be split. Replace the bad node we heard
	// from the longest time ago, if there is one
	int const max_fail = m_settings.max_fail_count;
	auto bad = b.end();
	for (auto k = b.begin(); k != b.end(); ++k)
	{
		if (k->status(max_fail) != node_status::bad) continue;
		if (bad == b.end() || k->last_seen < bad->last_seen) bad = k;
	}

	if (bad == b.end())
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		if (m_log != nullptr && m_log->should_log(dht_logger::routing_table))
		{
			m_log->log(dht_logger::routing_table, "bucket full, dropping node: %s %s"
				, aux::to_hex(e.id).c_str(), print_endpoint(e.ep()).c_str());
		}
#endif
		return failed_to_add;
	}

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::routing_table))
	{
		m_log->log(dht_logger::routing_table, "replacing bad node: %s %s with: %s %s"
			, aux::to_hex(bad->id).c_str(), print_endpoint(bad->ep()).c_str()
			, aux::to_hex(e.id).c_str(), print_endpoint(e.ep()).c_str());
	}
#endif
	*bad = e;
	return node_added;
}

void routing_table::split_bucket()
{
	int const bucket_index = int(m_buckets.size()) - 1;
	DHTSCAN_ASSERT(int(m_buckets.back().live_nodes.size()) >= m_bucket_size);

	// this is the last bucket, and it's full already. Split
	// it by adding another bucket
	m_buckets.emplace_back();
	bucket_t& new_bucket = m_buckets.back().live_nodes;
	bucket_t& b = m_buckets[std::size_t(bucket_index)].live_nodes;

	// move any node sharing more than bucket_index bits with our id to the
	// new bucket
	for (auto j = b.begin(); j != b.end();)
	{
		int const d = distance_exp(m_id, j->id);
		if (d >= 159 - bucket_index)
		{
			++j;
			continue;
		}
		// this entry belongs in the new bucket
		new_bucket.push_back(*j);
		j = b.erase(j);
	}

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::routing_table))
	{
		m_log->log(dht_logger::routing_table, "split bucket %d: %d nodes kept, %d moved"
			, bucket_index, int(b.size()), int(new_bucket.size()));
	}
#endif
}

void routing_table::for_each_node(std::function<void(node_entry const&)> f) const
{
	for (auto const& i : m_buckets)
	{
		for (auto const& j : i.live_nodes)
			f(j);
	}
}

void routing_table::node_failed(node_id const& nid, udp::endpoint const& ep)
{
	// if messages to ourself fails, ignore it
	if (nid == m_id) return;

	node_entry* j = find_entry(nid);

	// if the endpoint doesn't match, it's a different node
	// claiming the same ID. The node we have in our routing
	// table is not necessarily stale
	if (j == nullptr || j->ep() != ep) return;

	j->timed_out();

#ifndef DHTSCAN_DISABLE_LOGGING
	if (m_log != nullptr && m_log->should_log(dht_logger::routing_table))
	{
		m_log->log(dht_logger::routing_table, "NODE FAILED id: %s ip: %s fails: %d status: %s"
			, aux::to_hex(nid).c_str(), print_endpoint(j->ep()).c_str()
			, j->fail_count(), status_name(j->status(m_settings.max_fail_count)));
	}
#endif
}

void routing_table::mark_bad(node_id const& nid)
{
	node_entry* j = find_entry(nid);
	if (j == nullptr) return;
	j->mark_bad();
}

void routing_table::add_router_node(udp::endpoint const& router)
{
	m_router_nodes.insert(router);
}

// we heard from this node, but we don't know if it was spoofed or not (i.e.
// pinged == false)
void routing_table::heard_about(node_id const& id, udp::endpoint const& ep)
{
	add_node(node_entry(id, ep));
}

// this function is called every time the node sees a sign of a node being
// alive. It either inserts the node or resets its fail count
bool routing_table::node_seen(node_id const& id, udp::endpoint const& ep, int const rtt)
{
	return add_node(node_entry(id, ep, rtt, true));
}

std::vector<node_entry> routing_table::find_node(node_id const& target
	, find_nodes_flags_t const options, int count) const
{
	if (count == 0) count = m_bucket_size;

	std::vector<node_entry> l;
	bool const include_bad = bool(options & include_failed);
	int const max_fail = m_settings.max_fail_count;

	for (auto const& b : m_buckets)
	{
		for (auto const& n : b.live_nodes)
		{
			if (!include_bad && n.status(max_fail) == node_status::bad) continue;
			l.push_back(n);
		}
	}

	auto const cmp = [&target](node_entry const& lhs, node_entry const& rhs)
	{ return compare_ref(lhs.id, rhs.id, target); };

	if (int(l.size()) > count)
	{
		std::partial_sort(l.begin(), l.begin() + count, l.end(), cmp);
		l.resize(std::size_t(count));
	}
	else
	{
		std::sort(l.begin(), l.end(), cmp);
	}
	return l;
}

#if DHTSCAN_USE_ASSERTS
void routing_table::check_invariant() const
{
	int const num_buckets = int(m_buckets.size());
	for (int i = 0; i < num_buckets; ++i)
	{
		bool const last = (i == num_buckets - 1);
		for (auto const& n : m_buckets[std::size_t(i)].live_nodes)
		{
			int const shared = 159 - distance_exp(m_id, n.id);
			DHTSCAN_ASSERT(last ? shared >= i : shared == i);
			static_cast<void>(shared);
			static_cast<void>(last);
		}
		DHTSCAN_ASSERT(int(m_buckets[std::size_t(i)].live_nodes.size()) <= m_bucket_size || last);
	}
}
#endif

} } // namespace dhtscan::dht
