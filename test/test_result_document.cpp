/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <chrono>
#include <cstdio> // for remove
#include <cstdlib> // for setenv
#include <fstream>
#include <iterator>
#include <string>
#include <time.h> // for tzset

#include "test.hpp"
#include "dhtscan/result_document.hpp"

using namespace dhtscan;

namespace {

scan_result make_result()
{
	::setenv("TZ", "UTC", 1);
	::tzset();

	scan_result r;
	r.date_crawling = std::chrono::system_clock::time_point(
		std::chrono::duration_cast<std::chrono::system_clock::duration>(
			seconds(1700000000) + microseconds(123456)));

	info_hash_result a;
	a.hex = "c9e15763f722f23e98a29decdfae341b98d53056";
	a.peers.emplace_back(make_address("1.2.3.4"), std::uint16_t(6881));
	a.peers.emplace_back(make_address("10.0.0.1"), std::uint16_t(51413));
	r.hashes.push_back(a);

	info_hash_result b;
	b.hex = "0123456789abcdef0123456789abcdef01234567";
	r.hashes.push_back(b);
	return r;
}

std::string read_file(std::string const& path)
{
	std::ifstream f(path, std::ios::binary);
	return std::string(std::istreambuf_iterator<char>(f)
		, std::istreambuf_iterator<char>());
}

} // anonymous namespace

DHTSCAN_TEST(write_document)
{
	std::string const doc = write_result_document(make_result());

	// the date first, then the info-hashes in scan order. An info-hash
	// without peers still has its (empty) list
	TEST_EQUAL(doc,
		"{\n"
		"    \"date_crawling\": \"2023-11-14T22:13:20.123456\",\n"
		"    \"c9e15763f722f23e98a29decdfae341b98d53056\": [\n"
		"        \"1.2.3.4:6881\",\n"
		"        \"10.0.0.1:51413\"\n"
		"    ],\n"
		"    \"0123456789abcdef0123456789abcdef01234567\": []\n"
		"}");

	// rendering is deterministic
	TEST_EQUAL(write_result_document(make_result()), doc);
}

DHTSCAN_TEST(write_empty_document)
{
	scan_result r = make_result();
	r.hashes.clear();
	r.date_crawling = std::chrono::system_clock::time_point(
		std::chrono::duration_cast<std::chrono::system_clock::duration>(seconds(0)));

	TEST_EQUAL(write_result_document(r),
		"{\n"
		"    \"date_crawling\": \"1970-01-01T00:00:00\"\n"
		"}");
}

DHTSCAN_TEST(save_document)
{
	std::string const path = "test_result_document.json";
	scan_result const r = make_result();

	error_code ec;
	save_result_document(r, path, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(read_file(path), write_result_document(r));

	// an existing file is replaced
	scan_result empty = r;
	empty.hashes.clear();
	TEST_NOTHROW(save_result_document(empty, path));
	TEST_EQUAL(read_file(path), write_result_document(empty));

	std::remove(path.c_str());
}

DHTSCAN_TEST(save_document_error)
{
	std::string const path = "no/such/directory/output.json";
	scan_result const r = make_result();

	error_code ec;
	save_result_document(r, path, ec);
	TEST_CHECK(ec);

	TEST_THROW(save_result_document(r, path));
}
