/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_MSG_HPP_INCLUDED
#define DHTSCAN_MSG_HPP_INCLUDED

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "dhtscan/config.hpp"
#include "dhtscan/entry.hpp"
#include "dhtscan/error_code.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/span.hpp"
#include "dhtscan/kademlia/node_id.hpp"

namespace dhtscan { namespace dht {

// the error codes of KRPC error messages
enum krpc_error_code
{
	generic_error = 201,
	server_error = 202,
	protocol_error = 203,
	method_unknown = 204
};

enum class query_method : std::uint8_t
{
	ping,
	find_node,
	get_peers,
	announce_peer,
	// any method we don't implement. The name is kept in
	// query_message::method_name
	unknown
};

DHTSCAN_EXTRA_EXPORT char const* method_name(query_method m);

// a node ID and the endpoint it's reachable at, as carried by the compact
// "nodes" field
struct node_endpoint
{
	node_endpoint() = default;
	node_endpoint(node_id const& id_, udp::endpoint const& ep_) : id(id_), ep(ep_) {}

	bool operator==(node_endpoint const& rhs) const
	{ return id == rhs.id && ep == rhs.ep; }

	node_id id;
	udp::endpoint ep;
};

struct query_message
{
	std::string transaction_id;
	query_method method = query_method::ping;
	// the "q" value as it appeared on the wire. Only used for encoding
	// when method is unknown
	std::string method_name;
	node_id sender;
	// "target" for find_node, "info_hash" for get_peers and announce_peer
	node_id target;
	// announce_peer only
	int port = 0;
	bool implied_port = false;
	std::string token;
};

struct response_message
{
	std::string transaction_id;
	node_id sender;
	std::vector<node_endpoint> nodes;
	// the "values" field of a get_peers response
	std::vector<tcp::endpoint> peers;
	std::string token;
};

struct error_message
{
	std::string transaction_id;
	int code = generic_error;
	std::string message;
};

using message = std::variant<query_message, response_message, error_message>;

// returns the transaction ID of any kind of message
DHTSCAN_EXTRA_EXPORT std::string const& transaction_id(message const& m);

// a response, together with the address it came from. This is what
// observers are handed when their query is answered
struct msg
{
	msg(response_message const& m, udp::endpoint const& ep): message(m), addr(ep) {}

	// explicitly disallow assignment, to silence msvc warning
	msg& operator=(msg const&) = delete;

	// the message
	response_message const& message;

	// the address of the process sending or receiving
	// the message.
	udp::endpoint addr;
};

// describes one key a KRPC dictionary is expected to have
struct key_desc_t
{
	char const* name;
	// one of entry::data_type. entry::undefined_t means any type
	int type;
	// if > 0 and the type is a string, the string must have exactly
	// this length
	int size;
	int flags;

	enum {
		// this argument is optional, parsing will not
		// fail if it's not present. Optional keys of the wrong
		// type or size are treated as if they were not present
		optional = 1
	};
};

// verifies that a message has all the required
// entries and returns them in ret. Entries for optional
// keys that are missing (or invalid) are set to nullptr
DHTSCAN_EXTRA_EXPORT bool verify_message_impl(entry const& dict
	, span<key_desc_t const> desc
	, span<entry const*> ret, error_code& ec);

template <int Size>
bool verify_message(entry const& msg, key_desc_t const (&desc)[Size]
	, entry const* (&ret)[Size], error_code& ec)
{
	return verify_message_impl(msg, desc, ret, ec);
}

// reads one 26 byte compact node info, advancing ``in``
DHTSCAN_EXTRA_EXPORT node_endpoint read_node_endpoint(char const*& in);

// compact node info for each node, concatenated
DHTSCAN_EXTRA_EXPORT std::string write_nodes(std::vector<node_endpoint> const& nodes);

// parses a "nodes" string. A trailing partial node is ignored
DHTSCAN_EXTRA_EXPORT std::vector<node_endpoint> read_nodes(std::string_view nodes);

// the 6 byte compact peer info
DHTSCAN_EXTRA_EXPORT std::string write_peer(tcp::endpoint const& ep);

// builds the bencoded dictionary for a message. The client version "v" is
// left to the caller
DHTSCAN_EXTRA_EXPORT void write_message(message const& m, entry& e);

// parses a decoded KRPC dictionary. Returns false and sets ``ec`` if it's
// not a valid message
DHTSCAN_EXTRA_EXPORT bool read_message(entry const& e, message& m, error_code& ec);

DHTSCAN_EXTRA_EXPORT std::vector<char> encode(message const& m);

// bdecodes ``buf`` and parses it as a KRPC message. ``ec`` is set to either
// a bdecode_errors or an errors::krpc_* error on failure
DHTSCAN_EXTRA_EXPORT bool decode(span<char const> buf, message& m, error_code& ec);

} } // namespace dhtscan::dht

#endif // DHTSCAN_MSG_HPP_INCLUDED
