/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "dhtscan/scanner.hpp"
#include "dhtscan/result_document.hpp"
#include "dhtscan/hex.hpp"
#include "dhtscan/socket_io.hpp"
#include "dhtscan/version.hpp"
#include "dhtscan/kademlia/dht_logger.hpp"

using namespace dhtscan;

namespace {

std::atomic<scanner*> g_scanner(nullptr);

void stop(int)
{
	scanner* s = g_scanner.load();
	if (s != nullptr) s->abort();
}

[[noreturn]] void usage()
{
	std::cerr << "dht_scan " << dhtscan::version() << R"(
usage: dht_scan [OPTIONS]

Scan the DHT for torrent info hashes and peers.

OPTIONS:
  --hash <hex>                 a single info-hash to look up
  --hash-file <path>           a file with one info-hash per line
  --output <file>              the JSON file to write (default: output.json)
  --budget <seconds>           time spent on each info-hash (default: 30)
  --bootstrap-timeout <seconds>
                               longest time spent bootstrapping (default: 10)
  --port <n>                   the UDP port to listen on (default: any)
  --interface <ip>             the IPv4 address to bind to (default: 0.0.0.0)
  --concurrency <n>            info-hashes looked up at the same time (default: 1)
  --router <host:port>         a bootstrap router. May be given more than once,
                               replaces the default routers
  --verbose                    print the DHT log to stderr
  -h, --help                   print this message
)";
	std::exit(1);
}

// prints the DHT debug log to stderr
struct stderr_logger final : dht::dht_logger
{
#ifndef DHTSCAN_DISABLE_LOGGING
	bool should_log(module_t) const override { return true; }

	void log(module_t m, char const* fmt, ...) override DHTSCAN_FORMAT(3,4)
	{
		static char const* const prefix[] = {
			"tracker", "node", "routing_table", "rpc", "traversal", "scanner"};

		char buf[1024];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);
		std::fprintf(stderr, "[%s] %s\n", prefix[m], buf);
	}

	void log_packet(message_direction_t dir, span<char const> pkt
		, udp::endpoint const& node) override
	{
		std::fprintf(stderr, "[packet] %s %s (%d bytes)\n"
			, dir == incoming_message ? "<==" : "==>"
			, print_endpoint(node).c_str(), int(pkt.size()));
	}
#endif
};

// prints the progress of the scan, one line per event
struct print_progress final : scan_observer
{
	void on_bootstrap_start() override
	{
		std::cout << "Waiting for DHT to load..." << std::endl;
	}

	void on_bootstrap_done(int const nodes) override
	{
		if (nodes == 0)
			std::cout << "Warning: no DHT nodes could be reached." << std::endl;
		std::cout << "Starting DHT scan..." << std::endl;
	}

	void on_lookup_start(info_hash_result const& r) override
	{
		std::cout << "Scanning for hash: " << r.hex << "..." << std::endl;
	}

	void on_peer(info_hash_result const& r, tcp::endpoint const& ep) override
	{
		std::cout << "Found peer " << print_endpoint(ep)
			<< " for info_hash: " << r.hex << std::endl;
	}

	void on_lookup_done(info_hash_result const& r) override
	{
		std::cout << "Finished scanning for hash: " << r.hex << ". Found "
			<< r.peers.size() << " peers." << std::endl;
	}

	void on_abort() override
	{
		std::cout << "Scan stopped." << std::endl;
	}
};

bool parse_int(char const* str, int& out)
{
	char* end = nullptr;
	long const val = std::strtol(str, &end, 10);
	if (end == str || *end != '\0' || val < 0 || val > 0xffffff) return false;
	out = int(val);
	return true;
}

// "host:port", the host may be a name
bool parse_router(std::string const& str, std::pair<std::string, int>& out)
{
	auto const colon = str.rfind(':');
	if (colon == std::string::npos || colon == 0) return false;
	int port = 0;
	if (!parse_int(str.c_str() + colon + 1, port) || port == 0 || port > 0xffff)
		return false;
	out = {str.substr(0, colon), port};
	return true;
}

bool load_hash_file(std::string const& path, std::vector<std::string>& hashes)
{
	std::ifstream f(path);
	if (!f) return false;

	std::string line;
	while (std::getline(f, line))
	{
		auto const first = line.find_first_not_of(" \t\r\n\v\f");
		if (first == std::string::npos) continue;
		auto const last = line.find_last_not_of(" \t\r\n\v\f");
		hashes.push_back(line.substr(first, last - first + 1));
	}
	return !f.bad();
}

} // anonymous namespace

int main(int argc, char* argv[])
{
	std::string hash;
	std::string hash_file;
	std::string output = "output.json";
	int budget = 30;
	int bootstrap_timeout = 10;
	bool verbose = false;
	bool custom_routers = false;

	scan_settings settings;

	for (int i = 1; i < argc; ++i)
	{
		std::string const opt = argv[i];

		if (opt == "-h" || opt == "--help") usage();
		if (opt == "--verbose")
		{
			verbose = true;
			continue;
		}

		// the remaining options all take an argument
		if (i + 1 >= argc)
		{
			std::cerr << "missing argument to " << opt << "\n";
			usage();
		}
		std::string const arg = argv[++i];

		if (opt == "--hash") hash = arg;
		else if (opt == "--hash-file") hash_file = arg;
		else if (opt == "--output") output = arg;
		else if (opt == "--interface") settings.listen_interface = arg;
		else if (opt == "--budget")
		{
			if (!parse_int(arg.c_str(), budget) || budget == 0)
			{
				std::cerr << "invalid budget: " << arg << "\n";
				return 1;
			}
		}
		else if (opt == "--bootstrap-timeout")
		{
			if (!parse_int(arg.c_str(), bootstrap_timeout))
			{
				std::cerr << "invalid bootstrap timeout: " << arg << "\n";
				return 1;
			}
		}
		else if (opt == "--port")
		{
			if (!parse_int(arg.c_str(), settings.listen_port)
				|| settings.listen_port > 0xffff)
			{
				std::cerr << "invalid port: " << arg << "\n";
				return 1;
			}
		}
		else if (opt == "--concurrency")
		{
			if (!parse_int(arg.c_str(), settings.max_concurrent_lookups)
				|| settings.max_concurrent_lookups == 0)
			{
				std::cerr << "invalid concurrency: " << arg << "\n";
				return 1;
			}
		}
		else if (opt == "--router")
		{
			std::pair<std::string, int> r;
			if (!parse_router(arg, r))
			{
				std::cerr << "invalid router (expected host:port): " << arg << "\n";
				return 1;
			}
			if (!custom_routers) settings.router_nodes.clear();
			custom_routers = true;
			settings.router_nodes.push_back(std::move(r));
		}
		else
		{
			std::cerr << "unknown option: " << opt << "\n";
			usage();
		}
	}

	std::vector<std::string> hashes;
	if (!hash.empty())
	{
		hashes.push_back(hash);
	}
	else if (!hash_file.empty())
	{
		if (!load_hash_file(hash_file, hashes))
		{
			std::cerr << "failed to read hash file: " << hash_file << "\n";
			return 1;
		}
	}
	else
	{
		std::cout << "Error: No hash or hash file provided! Use --hash <hash_str> "
			"or --hash-file <filepath>" << std::endl;
		return 0;
	}

	if (output.empty())
	{
		std::cout << "Error: No output file provided! Use --output <file>.json" << std::endl;
		return 0;
	}

	settings.bootstrap_timeout = seconds(bootstrap_timeout);

	stderr_logger log;
	print_progress progress;
	io_context ios;
	scanner s(ios, settings, verbose ? &log : nullptr, &progress);

	g_scanner = &s;
	std::signal(SIGINT, &stop);
	std::signal(SIGTERM, &stop);

	scan_result result;
	try
	{
		result = s.scan(hashes, seconds(budget));
	}
	catch (system_error const& e)
	{
		g_scanner = nullptr;
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}
	g_scanner = nullptr;

	error_code ec;
	save_result_document(result, output, ec);
	if (ec)
	{
		std::cerr << "failed to write " << output << ": " << ec.message() << "\n";
		return 1;
	}

	std::cout << "Results saved to " << output << "." << std::endl;
	return 0;
}
