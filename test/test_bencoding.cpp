/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <iterator>
#include <string>

#include "test.hpp"
#include "dhtscan/bencode.hpp"
#include "dhtscan/bdecode.hpp"
#include "dhtscan/entry.hpp"

using namespace dhtscan;

namespace {

std::string encode(entry const& e)
{
	std::string ret;
	bencode(std::back_inserter(ret), e);
	return ret;
}

entry decode(std::string const& s)
{
	return bdecode(s);
}

error_code decode_error(std::string const& s, int* pos = nullptr)
{
	error_code ec;
	bdecode(s, ec, pos);
	return ec;
}

} // anonymous namespace

DHTSCAN_TEST(strings)
{
	entry e("spam");
	TEST_EQUAL(encode(e), "4:spam");
	TEST_CHECK(decode(encode(e)) == e);

	entry empty(std::string{});
	TEST_EQUAL(encode(empty), "0:");
	TEST_CHECK(decode("0:") == empty);

	// binary strings survive unchanged
	std::string const bin("\0\xff\x01" "e:", 5);
	entry b(bin);
	TEST_EQUAL(encode(b), std::string("5:") + bin);
	TEST_CHECK(decode(encode(b)).string() == bin);
}

DHTSCAN_TEST(integers)
{
	entry e(entry::integer_type(3));
	TEST_EQUAL(encode(e), "i3e");
	TEST_CHECK(decode(encode(e)) == e);

	entry n(entry::integer_type(-3));
	TEST_EQUAL(encode(n), "i-3e");
	TEST_CHECK(decode(encode(n)) == n);

	entry z(entry::integer_type(0));
	TEST_EQUAL(encode(z), "i0e");

	entry big(entry::integer_type(9223372036854775807LL));
	TEST_EQUAL(encode(big), "i9223372036854775807e");
	TEST_EQUAL(decode("i9223372036854775807e").integer(), 9223372036854775807LL);
}

DHTSCAN_TEST(lists)
{
	entry::list_type l;
	l.push_back(entry("spam"));
	l.push_back(entry("eggs"));
	entry e(l);
	TEST_EQUAL(encode(e), "l4:spam4:eggse");
	TEST_CHECK(decode(encode(e)) == e);

	entry empty(entry::list_t);
	TEST_EQUAL(encode(empty), "le");
}

DHTSCAN_TEST(dictionaries)
{
	entry e(entry::dictionary_t);
	e["spam"] = entry("eggs");
	e["cow"] = entry("moo");
	// keys are always written in sorted order
	TEST_EQUAL(encode(e), "d3:cow3:moo4:spam4:eggse");
	TEST_CHECK(decode(encode(e)) == e);

	entry nested;
	nested["a"]["b"] = entry::integer_type(1);
	nested["a"]["c"].list().push_back(entry("x"));
	TEST_EQUAL(encode(nested), "d1:ad1:bi1e1:cl1:xeee");
	TEST_CHECK(decode(encode(nested)) == nested);
}

DHTSCAN_TEST(undefined_node)
{
	entry e(entry::undefined_t);
	TEST_EQUAL(encode(e), "0:");

	entry d(entry::dictionary_t);
	d["info"] = entry(entry::undefined_t);
	TEST_EQUAL(encode(d), "d4:info0:e");
}

DHTSCAN_TEST(implicit_construct)
{
	entry e(entry::list_t);
	e.list().push_back(entry::list_t);
	TEST_EQUAL(e.list().back().type(), entry::list_t);
}

DHTSCAN_TEST(find_key)
{
	entry e = decode("d1:ai1e1:b3:fooe");
	TEST_CHECK(e.find_key("a") != nullptr);
	TEST_EQUAL(e.find_key("a")->integer(), 1);
	TEST_EQUAL(e.find_key("b")->string(), "foo");
	TEST_CHECK(e.find_key("c") == nullptr);

	entry const& ce = e;
	TEST_CHECK(ce.find_key("b") != nullptr);
}

DHTSCAN_TEST(wrong_type)
{
	entry e("foo");
	TEST_THROW(e.integer());
	TEST_THROW(static_cast<entry const&>(e).dict());

	try
	{
		e.list();
		TEST_ERROR("no exception thrown");
	}
	catch (system_error const& err)
	{
		TEST_CHECK(err.code() == errors::invalid_entry_type);
	}
}

DHTSCAN_TEST(decode_errors)
{
	int pos = 0;

	TEST_CHECK(decode_error("", &pos) == bdecode_errors::unexpected_eof);
	TEST_CHECK(decode_error("i12") == bdecode_errors::unexpected_eof);
	TEST_CHECK(decode_error("i1x2e") == bdecode_errors::expected_digit);
	TEST_CHECK(decode_error("4:ab") == bdecode_errors::unexpected_eof);
	TEST_CHECK(decode_error("4ab") == bdecode_errors::expected_colon);
	TEST_CHECK(decode_error("l4:spam") == bdecode_errors::unexpected_eof);
	TEST_CHECK(decode_error("d3:cow") == bdecode_errors::unexpected_eof);
	TEST_CHECK(decode_error("di1e3:fooe") == bdecode_errors::expected_digit);
	TEST_CHECK(decode_error("x") == bdecode_errors::expected_value);
	TEST_CHECK(decode_error("i99999999999999999999e") == bdecode_errors::overflow);

	TEST_CHECK(decode_error("d3:cowi1e1:", &pos) == bdecode_errors::unexpected_eof);
	TEST_EQUAL(pos, 11);

	TEST_CHECK(!decode_error("d3:cowi1ee"));
}

DHTSCAN_TEST(decode_limits)
{
	std::string deep(101, 'l');
	deep.append(101, 'e');
	TEST_CHECK(decode_error(deep) == bdecode_errors::depth_exceeded);

	std::string ok(50, 'l');
	ok.append(50, 'e');
	TEST_CHECK(!decode_error(ok));

	std::string many = "l";
	for (int i = 0; i < 3000; ++i) many += "i1e";
	many += "e";
	TEST_CHECK(decode_error(many) == bdecode_errors::limit_exceeded);

	error_code ec;
	bdecode(many, ec, nullptr, 100, 5000);
	TEST_CHECK(!ec);

	TEST_THROW(bdecode(deep));
}

DHTSCAN_TEST(error_messages)
{
	error_code ec = bdecode_errors::depth_exceeded;
	TEST_EQUAL(ec.category().name(), std::string("bdecode"));
	TEST_CHECK(!ec.message().empty());

	ec = errors::invalid_info_hash;
	TEST_EQUAL(ec.category().name(), std::string("dhtscan"));
	TEST_CHECK(ec.message().find("info-hash") != std::string::npos);
}
