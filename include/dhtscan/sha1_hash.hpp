/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_SHA1_HASH_HPP_INCLUDED
#define DHTSCAN_SHA1_HASH_HPP_INCLUDED

#include <array>
#include <cstdint>
#include <cstring> // for memcpy
#include <functional> // for std::hash
#include <string>
#if DHTSCAN_USE_IOSTREAM
#include <iosfwd>
#endif

#include "dhtscan/config.hpp"
#include "dhtscan/assert.hpp"
#include "dhtscan/span.hpp"

namespace dhtscan {

	// This type holds a 160 bit value. It is used for info-hashes and DHT
	// node IDs. It is an opaque object of 20 bytes; the bitwise operators are
	// there to implement the XOR distance metric, and the comparison operators
	// only exist so the type can be used as a key in ordered containers.
	class DHTSCAN_EXPORT sha1_hash
	{
	public:

		// the size of the hash in bytes
		static constexpr int size() noexcept { return 20; }

		// constructs an all-zero hash
		sha1_hash() noexcept { clear(); }

		// returns an all-F hash. i.e. the maximum value representable
		static sha1_hash max() noexcept
		{
			sha1_hash ret;
			ret.m_number.fill(0xff);
			return ret;
		}

		// returns an all-zero hash, i.e. the minimum value representable
		static sha1_hash min() noexcept
		{
			return sha1_hash();
		}

		// copies exactly 20 bytes from the pointer provided. If a null
		// pointer is passed in, the hash is cleared.
		explicit sha1_hash(char const* s) noexcept
		{
			if (s == nullptr) clear();
			else std::memcpy(m_number.data(), s, std::size_t(size()));
		}

		explicit sha1_hash(span<char const> s) noexcept { assign(s); }

		void assign(span<char const> s) noexcept
		{
			DHTSCAN_ASSERT(s.size() >= size());
			std::memcpy(m_number.data(), s.data(), std::size_t(size()));
		}
		void assign(char const* str) noexcept { std::memcpy(m_number.data(), str, std::size_t(size())); }

		char const* data() const noexcept { return reinterpret_cast<char const*>(m_number.data()); }
		char* data() noexcept { return reinterpret_cast<char*>(m_number.data()); }

		// set the hash to all zeros
		void clear() noexcept { m_number.fill(0); }

		// return true if all bytes are zero
		bool is_all_zeros() const noexcept
		{
			for (auto const v : m_number)
				if (v != 0) return false;
			return true;
		}

		bool operator==(sha1_hash const& n) const noexcept
		{ return m_number == n.m_number; }

		bool operator!=(sha1_hash const& n) const noexcept
		{ return m_number != n.m_number; }

		// bytewise big-endian order. Not to be used for routing decisions,
		// use the XOR distance functions in kademlia/node_id.hpp for those
		bool operator<(sha1_hash const& n) const noexcept
		{ return m_number < n.m_number; }

		// returns the number of leading zero bits
		int count_leading_zeroes() const noexcept;

		sha1_hash operator~() const noexcept
		{
			sha1_hash ret;
			for (int i = 0; i < size(); ++i)
				ret.m_number[std::size_t(i)] = std::uint8_t(~m_number[std::size_t(i)]);
			return ret;
		}

		sha1_hash operator^(sha1_hash const& n) const noexcept
		{
			sha1_hash ret = *this;
			ret ^= n;
			return ret;
		}

		sha1_hash& operator^=(sha1_hash const& n) noexcept
		{
			for (int i = 0; i < size(); ++i)
				m_number[std::size_t(i)] ^= n.m_number[std::size_t(i)];
			return *this;
		}

		sha1_hash operator&(sha1_hash const& n) const noexcept
		{
			sha1_hash ret = *this;
			ret &= n;
			return ret;
		}

		sha1_hash& operator&=(sha1_hash const& n) noexcept
		{
			for (int i = 0; i < size(); ++i)
				m_number[std::size_t(i)] &= n.m_number[std::size_t(i)];
			return *this;
		}

		std::uint8_t& operator[](std::size_t i) noexcept
		{ DHTSCAN_ASSERT(i < std::size_t(size())); return m_number[i]; }
		std::uint8_t const& operator[](std::size_t i) const noexcept
		{ DHTSCAN_ASSERT(i < std::size_t(size())); return m_number[i]; }

		using const_iterator = std::uint8_t const*;
		using iterator = std::uint8_t*;

		const_iterator begin() const noexcept { return m_number.data(); }
		const_iterator end() const noexcept { return m_number.data() + size(); }
		iterator begin() noexcept { return m_number.data(); }
		iterator end() noexcept { return m_number.data() + size(); }

		// return a copy of the 20 bytes representing the hash as a std::string.
		// It's still a binary string with 20 binary characters.
		std::string to_string() const
		{ return std::string(data(), std::size_t(size())); }

	private:

		std::array<std::uint8_t, 20> m_number;
	};

	// parses a 40 character hexadecimal string into ``h``. Returns false if
	// the string has the wrong length or contains non-hex characters, in
	// which case ``h`` is left unmodified.
	DHTSCAN_EXPORT bool parse_info_hash(span<char const> hex, sha1_hash& h);

#if DHTSCAN_USE_IOSTREAM

	// print a sha1_hash object to an ostream as 40 hexadecimal digits
	DHTSCAN_EXPORT std::ostream& operator<<(std::ostream& os, sha1_hash const& peer);

	// read 40 hexadecimal digits from an istream into a sha1_hash
	DHTSCAN_EXPORT std::istream& operator>>(std::istream& is, sha1_hash& peer);

#endif // DHTSCAN_USE_IOSTREAM
}

namespace std {

	template <>
	struct hash<dhtscan::sha1_hash>
	{
		std::size_t operator()(dhtscan::sha1_hash const& k) const
		{
			std::size_t ret;
			// the hash is uniformly distributed, any bytes will do
			std::memcpy(&ret, k.data(), sizeof(ret));
			return ret;
		}
	};
}

#endif // DHTSCAN_SHA1_HASH_HPP_INCLUDED
