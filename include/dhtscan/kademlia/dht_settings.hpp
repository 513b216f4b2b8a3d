/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_DHT_SETTINGS_HPP_INCLUDED
#define DHTSCAN_DHT_SETTINGS_HPP_INCLUDED

#include "dhtscan/config.hpp"
#include "dhtscan/time.hpp"

namespace dhtscan { namespace dht {

	// structure used to hold configuration options for the DHT
	struct DHTSCAN_EXPORT dht_settings
	{
		// the number of concurrent search request the node will send when
		// looking for peers or nodes (alpha)
		int search_branching = 3;

		// the max number of nodes in a routing table bucket (K)
		int bucket_size = 8;

		// the maximum number of failed tries to contact a node before it is
		// considered bad and excluded from lookups
		int max_fail_count = 3;

		// the maximum number of candidate nodes a single lookup keeps track
		// of. Candidates further away from the target are dropped
		int max_results = 100;

		// the time a query may stay outstanding before it is considered
		// failed
		time_duration query_timeout = seconds(4);

		// bootstrapping stops once the routing table holds this many nodes
		int bootstrap_min_nodes = 32;

		// the bootstrap does not follow nodes more than this many hops away
		// from the router nodes
		int bootstrap_max_rounds = 8;
	};

}}

#endif // DHTSCAN_DHT_SETTINGS_HPP_INCLUDED
