/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <iterator>

#include "dhtscan/kademlia/msg.hpp"
#include "dhtscan/bdecode.hpp"
#include "dhtscan/bencode.hpp"
#include "dhtscan/socket_io.hpp" // for read_v4_endpoint

namespace dhtscan { namespace dht {

namespace {

	struct method_entry
	{
		char const* name;
		query_method method;
	};

	method_entry const methods[] =
	{
		{"ping", query_method::ping},
		{"find_node", query_method::find_node},
		{"get_peers", query_method::get_peers},
		{"announce_peer", query_method::announce_peer},
	};

	query_method parse_method(std::string const& name)
	{
		for (auto const& m : methods)
			if (name == m.name) return m.method;
		return query_method::unknown;
	}

	// sets ec to the right error for a required key ``found`` didn't turn up
	bool require(entry const& dict, char const* key, entry const* found, error_code& ec)
	{
		if (found != nullptr) return true;
		ec = dict.find_key(key) == nullptr
			? errors::krpc_missing_field : errors::krpc_invalid_field;
		return false;
	}

	bool read_query(entry const& e, std::string const& tid, message& m, error_code& ec)
	{
		static key_desc_t const query_desc[] = {
			{"q", entry::string_t, 0, 0},
			{"a", entry::dictionary_t, 0, 0},
		};

		entry const* q[2];
		if (!verify_message(e, query_desc, q, ec)) return false;

		static key_desc_t const args_desc[] = {
			{"id", entry::string_t, 20, 0},
			{"target", entry::string_t, 20, key_desc_t::optional},
			{"info_hash", entry::string_t, 20, key_desc_t::optional},
			{"port", entry::int_t, 0, key_desc_t::optional},
			{"implied_port", entry::int_t, 0, key_desc_t::optional},
			{"token", entry::string_t, 0, key_desc_t::optional},
		};

		entry const& a = *q[1];
		entry const* args[6];
		if (!verify_message(a, args_desc, args, ec)) return false;

		query_message ret;
		ret.transaction_id = tid;
		ret.method_name = q[0]->string();
		ret.method = parse_method(ret.method_name);
		ret.sender = node_id(args[0]->string().data());

		switch (ret.method)
		{
			case query_method::ping:
			case query_method::unknown:
				break;
			case query_method::find_node:
				if (!require(a, "target", args[1], ec)) return false;
				ret.target = node_id(args[1]->string().data());
				break;
			case query_method::announce_peer:
				if (!require(a, "port", args[3], ec)) return false;
				if (!require(a, "token", args[5], ec)) return false;
				if (args[3]->integer() < 0 || args[3]->integer() > 65535)
				{
					ec = errors::krpc_invalid_field;
					return false;
				}
				ret.port = int(args[3]->integer());
				ret.implied_port = args[4] != nullptr && args[4]->integer() != 0;
				ret.token = args[5]->string();
				if (!require(a, "info_hash", args[2], ec)) return false;
				ret.target = node_id(args[2]->string().data());
				break;
			case query_method::get_peers:
				if (!require(a, "info_hash", args[2], ec)) return false;
				ret.target = node_id(args[2]->string().data());
				break;
		}

		m = std::move(ret);
		return true;
	}

	bool read_response(entry const& e, std::string const& tid, message& m, error_code& ec)
	{
		static key_desc_t const response_desc[] = {
			{"r", entry::dictionary_t, 0, 0},
		};

		entry const* r[1];
		if (!verify_message(e, response_desc, r, ec)) return false;

		static key_desc_t const values_desc[] = {
			{"id", entry::string_t, 20, 0},
			{"nodes", entry::string_t, 0, key_desc_t::optional},
			{"values", entry::list_t, 0, key_desc_t::optional},
			{"token", entry::string_t, 0, key_desc_t::optional},
		};

		entry const* values[4];
		if (!verify_message(*r[0], values_desc, values, ec)) return false;

		response_message ret;
		ret.transaction_id = tid;
		ret.sender = node_id(values[0]->string().data());
		if (values[1] != nullptr) ret.nodes = read_nodes(values[1]->string());
		if (values[2] != nullptr)
		{
			for (auto const& p : values[2]->list())
			{
				// peers that aren't 6 byte compact IPv4 endpoints are ignored
				if (p.type() != entry::string_t || p.string().size() != 6) continue;
				char const* ptr = p.string().data();
				ret.peers.push_back(detail::read_v4_endpoint<tcp::endpoint>(ptr));
			}
		}
		if (values[3] != nullptr) ret.token = values[3]->string();

		m = std::move(ret);
		return true;
	}

	bool read_error(entry const& e, std::string const& tid, message& m, error_code& ec)
	{
		static key_desc_t const error_desc[] = {
			{"e", entry::list_t, 0, 0},
		};

		entry const* err[1];
		if (!verify_message(e, error_desc, err, ec)) return false;

		entry::list_type const& l = err[0]->list();
		if (l.size() < 2
			|| l[0].type() != entry::int_t
			|| l[1].type() != entry::string_t)
		{
			ec = errors::krpc_invalid_field;
			return false;
		}

		error_message ret;
		ret.transaction_id = tid;
		ret.code = int(l[0].integer());
		ret.message = l[1].string();
		m = std::move(ret);
		return true;
	}

	struct message_writer
	{
		entry& e;

		void operator()(query_message const& m) const
		{
			e["t"] = m.transaction_id;
			e["y"] = "q";
			e["q"] = m.method == query_method::unknown
				? m.method_name : std::string(method_name(m.method));

			entry& a = e["a"];
			a["id"] = m.sender.to_string();
			switch (m.method)
			{
				case query_method::ping:
				case query_method::unknown:
					break;
				case query_method::find_node:
					a["target"] = m.target.to_string();
					break;
				case query_method::get_peers:
					a["info_hash"] = m.target.to_string();
					break;
				case query_method::announce_peer:
					a["info_hash"] = m.target.to_string();
					a["port"] = m.port;
					a["token"] = m.token;
					if (m.implied_port) a["implied_port"] = 1;
					break;
			}
		}

		void operator()(response_message const& m) const
		{
			e["t"] = m.transaction_id;
			e["y"] = "r";

			entry& r = e["r"];
			r["id"] = m.sender.to_string();
			if (!m.nodes.empty()) r["nodes"] = write_nodes(m.nodes);
			if (!m.peers.empty())
			{
				entry::list_type& pe = r["values"].list();
				for (auto const& p : m.peers)
					pe.emplace_back(write_peer(p));
			}
			if (!m.token.empty()) r["token"] = m.token;
		}

		void operator()(error_message const& m) const
		{
			e["t"] = m.transaction_id;
			e["y"] = "e";
			entry::list_type& l = e["e"].list();
			l.emplace_back(entry::integer_type(m.code));
			l.emplace_back(m.message);
		}
	};

} // anonymous namespace

char const* method_name(query_method const m)
{
	for (auto const& i : methods)
		if (i.method == m) return i.name;
	return "unknown";
}

std::string const& transaction_id(message const& m)
{
	return std::visit([](auto const& v) -> std::string const& { return v.transaction_id; }, m);
}

bool verify_message_impl(entry const& dict, span<key_desc_t const> desc
	, span<entry const*> ret, error_code& ec)
{
	DHTSCAN_ASSERT(desc.size() == ret.size());

	for (auto& r : ret) r = nullptr;

	if (dict.type() != entry::dictionary_t)
	{
		ec = errors::krpc_not_a_dictionary;
		return false;
	}

	for (std::ptrdiff_t i = 0; i < desc.size(); ++i)
	{
		key_desc_t const& k = desc[i];
		entry const* v = dict.find_key(k.name);

		bool const optional = (k.flags & key_desc_t::optional) != 0;

		if (v == nullptr)
		{
			if (optional) continue;
			// the key was not found, and it's not an optional key
			ec = errors::krpc_missing_field;
			return false;
		}

		// undefined_t means any type
		bool invalid = k.type != entry::undefined_t && v->type() != k.type;
		if (!invalid && k.size > 0 && k.type == entry::string_t)
			invalid = int(v->string().size()) != k.size;

		if (invalid)
		{
			if (optional) continue;
			ec = errors::krpc_invalid_field;
			return false;
		}
		ret[i] = v;
	}
	return true;
}

node_endpoint read_node_endpoint(char const*& in)
{
	node_endpoint ep;
	ep.id = node_id(in);
	in += node_id::size();
	ep.ep = detail::read_v4_endpoint<udp::endpoint>(in);
	return ep;
}

std::string write_nodes(std::vector<node_endpoint> const& nodes)
{
	std::string ret;
	ret.reserve(nodes.size() * 26);
	auto out = std::back_inserter(ret);
	for (auto const& n : nodes)
	{
		ret.append(n.id.data(), std::size_t(node_id::size()));
		detail::write_endpoint(n.ep, out);
	}
	return ret;
}

std::vector<node_endpoint> read_nodes(std::string_view const nodes)
{
	std::vector<node_endpoint> ret;
	char const* ptr = nodes.data();
	char const* const end = ptr + nodes.size();
	int const entry_size = node_id::size() + detail::address_v4_size + 2;
	while (end - ptr >= entry_size)
		ret.push_back(read_node_endpoint(ptr));
	return ret;
}

std::string write_peer(tcp::endpoint const& ep)
{
	std::string ret;
	detail::write_endpoint(ep, std::back_inserter(ret));
	return ret;
}

void write_message(message const& m, entry& e)
{
	std::visit(message_writer{e}, m);
}

bool read_message(entry const& e, message& m, error_code& ec)
{
	ec.clear();

	static key_desc_t const top_desc[] = {
		{"t", entry::string_t, 0, 0},
		{"y", entry::string_t, 1, 0},
	};

	entry const* top[2];
	if (!verify_message(e, top_desc, top, ec)) return false;

	std::string const& tid = top[0]->string();
	switch (top[1]->string()[0])
	{
		case 'q': return read_query(e, tid, m, ec);
		case 'r': return read_response(e, tid, m, ec);
		case 'e': return read_error(e, tid, m, ec);
		default:
			ec = errors::krpc_unknown_message_type;
			return false;
	}
}

std::vector<char> encode(message const& m)
{
	entry e;
	write_message(m, e);
	std::vector<char> ret;
	bencode(std::back_inserter(ret), e);
	return ret;
}

bool decode(span<char const> buf, message& m, error_code& ec)
{
	entry const e = bdecode(buf, ec);
	if (ec) return false;
	return read_message(e, m, ec);
}

} } // namespace dhtscan::dht
