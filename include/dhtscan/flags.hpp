/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_FLAGS_HPP_INCLUDED
#define DHTSCAN_FLAGS_HPP_INCLUDED

#include <type_traits> // for enable_if

namespace dhtscan {

struct bit_t
{
	explicit constexpr bit_t(int b) : m_bit_idx(b) {}
	explicit constexpr operator int() const { return m_bit_idx; }
private:
	int m_bit_idx;
};

constexpr bit_t operator "" _bit(unsigned long long int b) { return bit_t{static_cast<int>(b)}; }

namespace flags {

// a type-safe set of bit flags. The Tag type prevents flags of one kind from
// being combined with flags of another
template<typename UnderlyingType, typename Tag
	, typename Cond = typename std::enable_if<std::is_integral<UnderlyingType>::value>::type>
struct bitfield_flag
{
	static_assert(std::is_unsigned<UnderlyingType>::value
		, "flags must use unsigned integers as underlying types");

	using underlying_type = UnderlyingType;

	constexpr bitfield_flag(bitfield_flag const& rhs) noexcept = default;
	constexpr bitfield_flag(bitfield_flag&& rhs) noexcept = default;
	constexpr bitfield_flag() noexcept : m_val(0) {}
	explicit constexpr bitfield_flag(UnderlyingType const val) noexcept : m_val(val) {}
	constexpr bitfield_flag(bit_t const bit) noexcept // NOLINT
		: m_val(static_cast<UnderlyingType>(UnderlyingType{1} << static_cast<int>(bit))) {}
	explicit constexpr operator UnderlyingType() const noexcept { return m_val; }
	explicit constexpr operator bool() const noexcept { return m_val != 0; }

	bool constexpr operator==(bitfield_flag const f) const noexcept
	{ return m_val == f.m_val; }

	bool constexpr operator!=(bitfield_flag const f) const noexcept
	{ return m_val != f.m_val; }

	bitfield_flag& operator|=(bitfield_flag const f) & noexcept
	{
		m_val |= f.m_val;
		return *this;
	}

	bitfield_flag& operator&=(bitfield_flag const f) & noexcept
	{
		m_val &= f.m_val;
		return *this;
	}

	constexpr friend bitfield_flag operator|(bitfield_flag const lhs, bitfield_flag const rhs) noexcept
	{
		return bitfield_flag(static_cast<UnderlyingType>(lhs.m_val | rhs.m_val));
	}

	constexpr friend bitfield_flag operator&(bitfield_flag const lhs, bitfield_flag const rhs) noexcept
	{
		return bitfield_flag(static_cast<UnderlyingType>(lhs.m_val & rhs.m_val));
	}

	constexpr bitfield_flag operator~() const noexcept
	{
		// m_val is promoted to int before applying operator~, so the result
		// has to be narrowed back to the underlying type
		return bitfield_flag(static_cast<UnderlyingType>(~m_val));
	}

	bitfield_flag& operator=(bitfield_flag const& rhs) & noexcept = default;
	bitfield_flag& operator=(bitfield_flag&& rhs) & noexcept = default;

private:
	UnderlyingType m_val;
};

} // flags
} // dhtscan

#endif // DHTSCAN_FLAGS_HPP_INCLUDED
