/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_IO_HPP_INCLUDED
#define DHTSCAN_IO_HPP_INCLUDED

#include <cstdint>

namespace dhtscan {
namespace detail {

	template <class T> struct type {};

	// reads an integer from a byte stream
	// in big endian byte order and converts
	// it to native endianess
	template <class T, class InIt>
	inline T read_impl(InIt& start, type<T>)
	{
		T ret = 0;
		for (int i = 0; i < int(sizeof(T)); ++i)
		{
			ret <<= 8;
			ret |= static_cast<std::uint8_t>(*start);
			++start;
		}
		return ret;
	}

	template <class InIt>
	std::uint8_t read_impl(InIt& start, type<std::uint8_t>)
	{
		return static_cast<std::uint8_t>(*start++);
	}

	template <class T, class OutIt>
	inline void write_impl(T val, OutIt& start)
	{
		for (int i = int(sizeof(T)) - 1; i >= 0; --i)
		{
			*start = static_cast<char>((val >> (i * 8)) & 0xff);
			++start;
		}
	}

	// -- adaptors

	template <class InIt>
	std::uint32_t read_uint32(InIt& start)
	{ return read_impl(start, type<std::uint32_t>()); }

	template <class InIt>
	std::uint16_t read_uint16(InIt& start)
	{ return read_impl(start, type<std::uint16_t>()); }

	template <class OutIt>
	void write_uint32(std::uint32_t val, OutIt& start)
	{ write_impl(val, start); }

	template <class OutIt>
	void write_uint16(std::uint16_t val, OutIt& start)
	{ write_impl(val, start); }
}
}

#endif // DHTSCAN_IO_HPP_INCLUDED
