/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_DHT_LOGGER_HPP_INCLUDED
#define DHTSCAN_DHT_LOGGER_HPP_INCLUDED

#include "dhtscan/config.hpp"
#include "dhtscan/socket.hpp"
#include "dhtscan/span.hpp"

namespace dhtscan { namespace dht {

	// the interface the DHT reports its debug log through. dhtscan never
	// writes to stdout or stderr on its own, the application decides where
	// (and whether) log lines end up
	struct DHTSCAN_EXTRA_EXPORT dht_logger
	{
#ifndef DHTSCAN_DISABLE_LOGGING
		enum module_t
		{
			tracker,
			node,
			routing_table,
			rpc_manager,
			traversal,
			scanner
		};

		enum message_direction_t
		{
			incoming_message,
			outgoing_message
		};

		virtual bool should_log(module_t m) const = 0;
		virtual void log(module_t m, char const* fmt, ...) DHTSCAN_FORMAT(3,4) = 0;
		virtual void log_packet(message_direction_t dir, span<char const> pkt
			, udp::endpoint const& node) = 0;
#endif

	protected:
		~dht_logger() = default;
	};
}
}

#endif // DHTSCAN_DHT_LOGGER_HPP_INCLUDED
