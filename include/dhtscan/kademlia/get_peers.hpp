/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_GET_PEERS_HPP
#define DHTSCAN_GET_PEERS_HPP

#include <functional>
#include <set>
#include <vector>

#include "dhtscan/kademlia/traversal_algorithm.hpp"

namespace dhtscan {
namespace dht {

// the lookup of the peers of one info-hash. It walks towards the info-hash
// with get_peers queries and collects the "values" of every reply
struct DHTSCAN_EXTRA_EXPORT get_peers : traversal_algorithm
{
	// called with the peers a reply added to the set. Peers already seen are
	// not reported again
	using data_callback = std::function<void(std::vector<tcp::endpoint> const&)>;

	// called once, when the lookup ends, with every peer found (sorted) and
	// the reason it ended
	using done_callback = std::function<void(std::vector<tcp::endpoint> const&
		, traversal_status)>;

	get_peers(node& dht_node, node_id const& target
		, data_callback dcallback
		, done_callback ncallback);

	void got_peers(std::vector<tcp::endpoint> const& peers);

	void start() override;

	char const* name() const override;

	int num_peers() const { return int(m_peers.size()); }

protected:

	void done() override;
	bool invoke(observer_ptr o) override;
	observer_ptr new_observer(udp::endpoint const& ep
		, node_id const& id) override;

	data_callback m_data_callback;
	done_callback m_done_callback;
	std::set<tcp::endpoint> m_peers;
};

struct DHTSCAN_EXTRA_EXPORT get_peers_observer : traversal_observer
{
	get_peers_observer(
		std::shared_ptr<traversal_algorithm> algorithm
		, udp::endpoint const& ep, node_id const& id)
		: traversal_observer(std::move(algorithm), ep, id)
	{}

	void reply(msg const&) override;
#ifndef DHTSCAN_DISABLE_LOGGING
private:
	void log_peers(msg const& m) const;
#endif
};

} // namespace dht
} // namespace dhtscan

#endif // DHTSCAN_GET_PEERS_HPP
