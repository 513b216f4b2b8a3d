/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_SPAN_HPP_INCLUDED
#define DHTSCAN_SPAN_HPP_INCLUDED

#include <type_traits>
#include <cstddef>

#include "dhtscan/assert.hpp"

namespace dhtscan {

namespace aux {

	template <typename From, typename To>
	struct compatible_type
	{
		// conversions that are OK
		// T -> T
		// T -> const T
		static const bool value = std::is_same<From, To>::value
			|| std::is_same<From, typename std::remove_const<To>::type>::value;
	};
}

	// a non-owning view of a contiguous range of objects
	template <typename T>
	struct span
	{
		using value_type = typename std::remove_const<T>::type;
		using index_type = std::ptrdiff_t;
		using iterator = T*;

		span() noexcept : m_ptr(nullptr), m_len(0) {}

		template <typename U, typename
			= typename std::enable_if<aux::compatible_type<U, T>::value>::type>
		span(span<U> const& v) noexcept // NOLINT
			: m_ptr(v.data()), m_len(v.size()) {}

		span(T& p) noexcept : m_ptr(&p), m_len(1) {} // NOLINT
		span(T* p, index_type const l) noexcept : m_ptr(p), m_len(l) // NOLINT
		{ DHTSCAN_ASSERT(l >= 0); }

		template <typename U, std::size_t N>
		span(U (&arr)[N]) noexcept // NOLINT
			: m_ptr(&arr[0]), m_len(static_cast<index_type>(N)) {}

		// anything with a .data() member function is considered a container
		template <typename Cont
			, typename U = typename std::remove_reference<decltype(*std::declval<Cont&>().data())>::type
			, typename = typename std::enable_if<aux::compatible_type<U, T>::value>::type>
		span(Cont& c) // NOLINT
			: m_ptr(c.data()), m_len(static_cast<index_type>(c.size())) {}

		template <typename Cont
			, typename U = typename std::remove_reference<decltype(*std::declval<Cont const&>().data())>::type
			, typename = typename std::enable_if<aux::compatible_type<U, T>::value>::type>
		span(Cont const& c) // NOLINT
			: m_ptr(c.data()), m_len(static_cast<index_type>(c.size())) {}

		index_type size() const noexcept { return m_len; }
		bool empty() const noexcept { return m_len == 0; }
		T* data() const noexcept { return m_ptr; }

		iterator begin() const noexcept { return m_ptr; }
		iterator end() const noexcept { return m_ptr + m_len; }

		T& front() const noexcept { DHTSCAN_ASSERT(m_len > 0); return m_ptr[0]; }
		T& back() const noexcept { DHTSCAN_ASSERT(m_len > 0); return m_ptr[m_len - 1]; }

		span<T> first(index_type const n) const
		{
			DHTSCAN_ASSERT(size() >= n);
			DHTSCAN_ASSERT(n >= 0);
			return { data(), n };
		}

		span<T> last(index_type const n) const
		{
			DHTSCAN_ASSERT(size() >= n);
			DHTSCAN_ASSERT(n >= 0);
			return { data() + size() - n, n };
		}

		span<T> subspan(index_type const offset) const
		{
			DHTSCAN_ASSERT(size() >= offset);
			DHTSCAN_ASSERT(offset >= 0);
			return { data() + offset, size() - offset };
		}

		span<T> subspan(index_type const offset, index_type const count) const
		{
			DHTSCAN_ASSERT(count >= 0);
			DHTSCAN_ASSERT(size() >= offset);
			DHTSCAN_ASSERT(size() >= offset + count);
			return { data() + offset, count };
		}

		T& operator[](index_type const idx) const noexcept
		{
			DHTSCAN_ASSERT(idx >= 0);
			DHTSCAN_ASSERT(idx < m_len);
			return m_ptr[idx];
		}

	private:
		T* m_ptr;
		index_type m_len;
	};
}

#endif // DHTSCAN_SPAN_HPP_INCLUDED
