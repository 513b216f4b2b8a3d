/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_BENCODE_HPP_INCLUDED
#define DHTSCAN_BENCODE_HPP_INCLUDED

// This file declares the bencode function. It
// takes an entry and writes its bencoded
// representation to an output iterator.
//
// The iterator must be an output iterator of
// char, like std::back_inserter of a
// std::vector<char> or std::string.
//
// bencode is the wire format of KRPC, the
// protocol spoken by DHT nodes.

#include <string>
#include <iterator> // for distance
#include <cstdio> // for snprintf

#include "dhtscan/config.hpp"
#include "dhtscan/entry.hpp"
#include "dhtscan/assert.hpp"

namespace dhtscan {

namespace detail {

	template <class OutIt, class In>
	int write_string(In const& str, OutIt& out)
	{
		int ret = 0;
		for (auto const c : str)
		{
			*out = c;
			++out;
			++ret;
		}
		return ret;
	}

	template <class OutIt>
	int write_integer(OutIt& out, entry::integer_type val)
	{
		// the stack allocated buffer for keeping the
		// decimal representation of the number can
		// not hold number bigger than this:
		static_assert(sizeof(entry::integer_type) <= 8, "64 bit integers required");
		char buf[21];
		int const len = std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(val));
		for (int i = 0; i < len; ++i)
		{
			*out = buf[i];
			++out;
		}
		return len;
	}

	template <class OutIt>
	void write_char(OutIt& out, char c)
	{
		*out = c;
		++out;
	}

	template <class OutIt>
	int bencode_recursive(OutIt& out, entry const& e)
	{
		int ret = 0;
		switch (e.type())
		{
		case entry::int_t:
			write_char(out, 'i');
			ret += write_integer(out, e.integer());
			write_char(out, 'e');
			ret += 2;
			break;
		case entry::string_t:
			ret += write_integer(out, entry::integer_type(e.string().length()));
			write_char(out, ':');
			ret += write_string(e.string(), out);
			ret += 1;
			break;
		case entry::list_t:
			write_char(out, 'l');
			for (auto const& i : e.list())
				ret += bencode_recursive(out, i);
			write_char(out, 'e');
			ret += 2;
			break;
		case entry::dictionary_t:
			write_char(out, 'd');
			// the keys are stored sorted by their raw bytes, which is the
			// order bencoding requires
			for (auto const& i : e.dict())
			{
				// write key
				ret += write_integer(out, entry::integer_type(i.first.length()));
				write_char(out, ':');
				ret += write_string(i.first, out);
				// write value
				ret += bencode_recursive(out, i.second);
				ret += 1;
			}
			write_char(out, 'e');
			ret += 2;
			break;
		case entry::undefined_t:
			// empty string
			write_char(out, '0');
			write_char(out, ':');
			ret += 2;
			break;
		}
		return ret;
	}
}

	// This function will encode data to bencoded form.
	//
	// The entry class is the internal representation of the bencoded data
	// and it can be used to retrieve information, an entry can also be build by
	// the program and given to ``bencode()`` to encode it into the ``OutIt``
	// iterator.
	//
	// ``OutIt`` is an OutputIterator. It's a template and usually
	// instantiated as ostream_iterator or back_insert_iterator. This
	// function assumes the value_type of the iterator is a ``char``.
	// In order to encode entry ``e`` into a buffer, do::
	//
	//	std::vector<char> buffer;
	//	bencode(std::back_inserter(buf), e);
	template<class OutIt> int bencode(OutIt out, entry const& e)
	{
		return detail::bencode_recursive(out, e);
	}
}

#endif // DHTSCAN_BENCODE_HPP_INCLUDED
