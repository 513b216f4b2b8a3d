/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <array>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/buffer.hpp>

#include "test.hpp"
#include "dhtscan/scanner.hpp"
#include "dhtscan/socket_io.hpp"
#include "dhtscan/kademlia/msg.hpp"

using namespace dhtscan;
using namespace dhtscan::dht;

namespace {

char const hash_a[] = "c9e15763f722f23e98a29decdfae341b98d53056";
char const hash_b[] = "0123456789abcdef0123456789abcdef01234567";

sha1_hash to_hash(std::string const& hex)
{
	sha1_hash ret;
	TEST_CHECK(parse_info_hash(hex, ret));
	return ret;
}

tcp::endpoint peer(int const n)
{
	return tcp::endpoint(address_v4(std::uint32_t(0x01020300 + n)), 6881);
}

// a DHT node on the loopback interface, answering queries on the same
// io_context the scanner runs
struct fake_node
{
	explicit fake_node(io_context& ios)
		: m_socket(ios, udp::endpoint(make_address("127.0.0.1"), 0))
	{
		m_id[0] = 0x42;
		start_receive();
	}

	fake_node(fake_node const&) = delete;
	fake_node& operator=(fake_node const&) = delete;

	int port() const { return m_socket.local_endpoint().port(); }

	void add_peers(sha1_hash const& ih, std::vector<tcp::endpoint> p)
	{
		m_peers.emplace_back(ih, std::move(p));
	}

	// the queries that were received
	int num_queries = 0;
	int num_get_peers = 0;
	// don't answer anything
	bool silent = false;

private:

	void start_receive()
	{
		m_socket.async_receive_from(boost::asio::buffer(m_buf), m_remote
			, [this](error_code const& e, std::size_t const n) { on_receive(e, n); });
	}

	void on_receive(error_code const& e, std::size_t const n)
	{
		if (e) return;

		message m;
		error_code ec;
		if (decode({m_buf.data(), std::ptrdiff_t(n)}, m, ec))
		{
			if (auto const* q = std::get_if<query_message>(&m))
			{
				++num_queries;
				if (!silent) respond(*q);
			}
		}
		start_receive();
	}

	void respond(query_message const& q)
	{
		response_message r;
		r.transaction_id = q.transaction_id;
		r.sender = m_id;
		if (q.method == query_method::get_peers)
		{
			++num_get_peers;
			r.token = "tokn";
			for (auto const& p : m_peers)
				if (p.first == q.target) r.peers = p.second;
		}

		std::vector<char> const buf = encode(r);
		error_code ec;
		m_socket.send_to(boost::asio::buffer(buf), m_remote, 0, ec);
		TEST_CHECK(!ec);
	}

	udp::socket m_socket;
	node_id m_id;
	std::array<char, 1500> m_buf;
	udp::endpoint m_remote;
	std::vector<std::pair<sha1_hash, std::vector<tcp::endpoint>>> m_peers;
};

// records the progress notifications, one string per call
struct record_progress final : scan_observer
{
	void on_bootstrap_start() override
	{ events.push_back("bootstrap"); }

	void on_bootstrap_done(int const nodes) override
	{ events.push_back("bootstrapped " + std::to_string(nodes)); }

	void on_lookup_start(info_hash_result const& r) override
	{
		events.push_back("start " + r.hex);
		if (abort_on_start != nullptr) abort_on_start->abort();
	}

	void on_peer(info_hash_result const&, tcp::endpoint const&) override
	{ ++peers; }

	void on_lookup_done(info_hash_result const& r) override
	{
		events.push_back("done " + r.hex + " "
			+ std::to_string(r.peers.size()) + " " + status_name(r.status));
	}

	void on_abort() override
	{ events.push_back("abort"); }

	std::vector<std::string> events;
	int peers = 0;
	scanner* abort_on_start = nullptr;
};

scan_settings local_settings(fake_node const& router)
{
	scan_settings sett;
	sett.listen_interface = "127.0.0.1";
	sett.router_nodes = {{"127.0.0.1", router.port()}};
	sett.bootstrap_timeout = milliseconds(500);
	return sett;
}

} // anonymous namespace

DHTSCAN_TEST(scan)
{
	io_context ios;
	fake_node router(ios);
	router.add_peers(to_hash(hash_a)
		, {peer(5), peer(3), peer(1), peer(4), peer(2)});

	record_progress progress;
	scanner s(ios, local_settings(router), nullptr, &progress);

	// the same info-hash, spelled differently, is only looked up once
	std::string const hash_a_upper = "C9E15763F722F23E98A29DECDFAE341B98D53056";
	scan_result const r = s.scan({hash_a, hash_b, hash_a_upper}, seconds(5));

	TEST_CHECK(!r.aborted);
	TEST_EQUAL(r.routing_table_size, 0);
	TEST_EQUAL(r.hashes.size(), 2);
	TEST_EQUAL(router.num_get_peers, 2);

	info_hash_result const* a = r.find(hash_a);
	TEST_CHECK(a != nullptr);
	if (a != nullptr)
	{
		TEST_CHECK(a->info_hash == to_hash(hash_a));
		TEST_CHECK(a->status == traversal_status::converged);
		// sorted
		TEST_EQUAL(a->peers.size(), 5);
		for (int i = 0; i < int(a->peers.size()); ++i)
			TEST_EQUAL(a->peers[std::size_t(i)], peer(i + 1));
	}

	info_hash_result const* b = r.find(hash_b);
	TEST_CHECK(b != nullptr);
	if (b != nullptr)
	{
		TEST_CHECK(b->peers.empty());
		TEST_CHECK(b->status == traversal_status::converged);
	}

	TEST_CHECK(r.find(hash_a_upper) == nullptr);
	TEST_CHECK(r.date_crawling.time_since_epoch().count() != 0);

	TEST_EQUAL(progress.peers, 5);
	std::vector<std::string> const expected = {
		"bootstrap"
		, "bootstrapped 0"
		, std::string("start ") + hash_a
		, std::string("done ") + hash_a + " 5 converged"
		, std::string("start ") + hash_b
		, std::string("done ") + hash_b + " 0 converged"};
	TEST_EQUAL(progress.events.size(), expected.size());
	for (std::size_t i = 0; i < std::min(expected.size(), progress.events.size()); ++i)
		TEST_EQUAL(progress.events[i], expected[i]);

	// a scanner can be run more than once
	scan_result const r2 = s.scan({hash_b}, seconds(5));
	TEST_EQUAL(r2.hashes.size(), 1);
	TEST_EQUAL(router.num_get_peers, 3);
}

DHTSCAN_TEST(concurrent_lookups)
{
	io_context ios;
	fake_node router(ios);
	router.add_peers(to_hash(hash_a), {peer(1)});
	router.add_peers(to_hash(hash_b), {peer(2), peer(3)});

	scan_settings sett = local_settings(router);
	sett.max_concurrent_lookups = 2;
	scanner s(ios, sett);

	scan_result const r = s.scan({hash_a, hash_b}, seconds(5));
	TEST_EQUAL(r.hashes.size(), 2);
	// results are in the order the hashes were given
	if (r.hashes.size() == 2)
	{
		TEST_EQUAL(r.hashes[0].hex, hash_a);
		TEST_EQUAL(r.hashes[0].peers.size(), 1);
		TEST_EQUAL(r.hashes[1].hex, hash_b);
		TEST_EQUAL(r.hashes[1].peers.size(), 2);
	}
}

DHTSCAN_TEST(lookup_budget)
{
	io_context ios;
	fake_node router(ios);
	router.silent = true;

	scan_settings sett = local_settings(router);
	sett.bootstrap_timeout = milliseconds(300);
	record_progress progress;
	scanner s(ios, sett, nullptr, &progress);

	time_point const start = clock_type::now();
	scan_result const r = s.scan({hash_a}, milliseconds(300));
	time_duration const elapsed = clock_type::now() - start;

	// no one answered, the query timeout is never reached
	TEST_CHECK(elapsed < sett.dht.query_timeout);
	TEST_EQUAL(r.hashes.size(), 1);
	if (!r.hashes.empty())
	{
		TEST_CHECK(r.hashes[0].status == traversal_status::timed_out);
		TEST_CHECK(r.hashes[0].peers.empty());
	}
	// the bootstrap and the lookup both asked the router
	TEST_EQUAL(router.num_queries, 2);
	TEST_EQUAL(progress.events.size(), 4);
}

DHTSCAN_TEST(abort_scan)
{
	io_context ios;
	fake_node router(ios);
	router.silent = true;

	scan_settings sett = local_settings(router);
	sett.bootstrap_timeout = milliseconds(200);
	record_progress progress;
	scanner s(ios, sett, nullptr, &progress);
	progress.abort_on_start = &s;

	scan_result const r = s.scan({hash_a, hash_b}, seconds(30));

	TEST_CHECK(r.aborted);
	TEST_CHECK(s.is_aborted());
	// the lookup that never started is not part of the result
	TEST_EQUAL(r.hashes.size(), 1);
	if (!r.hashes.empty())
	{
		TEST_EQUAL(r.hashes[0].hex, hash_a);
		TEST_CHECK(r.hashes[0].status == traversal_status::aborted);
	}
	TEST_CHECK(std::find(progress.events.begin(), progress.events.end(), "abort")
		!= progress.events.end());
}

DHTSCAN_TEST(invalid_info_hash)
{
	io_context ios;
	scan_settings sett;
	sett.router_nodes.clear();
	scanner s(ios, sett);

	error_code ec;
	scan_result const r = s.scan({hash_a, "not-a-hash"}, seconds(1), ec);
	TEST_CHECK(ec == errors::invalid_info_hash);
	TEST_CHECK(r.hashes.empty());

	// too short
	ec.clear();
	s.scan({"c9e15763f722f23e98a29decdfae341b98d5305"}, seconds(1), ec);
	TEST_CHECK(ec == errors::invalid_info_hash);

	try
	{
		s.scan({"zz"}, seconds(1));
		TEST_ERROR("no exception thrown");
	}
	catch (system_error const& e)
	{
		TEST_CHECK(e.code() == errors::invalid_info_hash);
		// the offending hash is part of the message
		TEST_CHECK(std::string(e.what()).find("zz") != std::string::npos);
	}
}

DHTSCAN_TEST(invalid_interface)
{
	io_context ios;
	scan_settings sett;
	sett.router_nodes.clear();
	sett.listen_interface = "not an address";
	scanner s(ios, sett);

	error_code ec;
	s.scan({hash_a}, seconds(1), ec);
	TEST_CHECK(ec);

	TEST_THROW(s.scan({hash_a}, seconds(1)));
}

DHTSCAN_TEST(no_routers)
{
	io_context ios;
	scan_settings sett;
	sett.router_nodes.clear();
	sett.listen_interface = "127.0.0.1";
	record_progress progress;
	scanner s(ios, sett, nullptr, &progress);

	// there is no one to ask, the lookups end right away
	scan_result const r = s.scan({hash_a}, seconds(30));
	TEST_EQUAL(r.routing_table_size, 0);
	TEST_EQUAL(r.hashes.size(), 1);
	if (!r.hashes.empty())
	{
		TEST_CHECK(r.hashes[0].peers.empty());
		TEST_CHECK(r.hashes[0].status == traversal_status::converged);
	}
}
