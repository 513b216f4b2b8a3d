/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_ENTRY_HPP_INCLUDED
#define DHTSCAN_ENTRY_HPP_INCLUDED

/*
 *
 * This file declares the entry class. It is a
 * variant-type that can be an integer, list,
 * dictionary (map) or a string. This type is
 * used to hold bdecoded data (which is the
 * encoding KRPC messages use).
 *
 * it has 4 accessors to access the actual
 * type of the object. They are:
 * integer()
 * string()
 * list()
 * dict()
 * The actual type has to match the type you
 * are asking for, otherwise a system_error is
 * thrown. A default constructed entry is
 * undefined, and the non-const accessors turn
 * an undefined entry into the requested type.
 *
 */

#include <cstdint>
#include <functional> // for less<>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "dhtscan/config.hpp"
#include "dhtscan/error_code.hpp"

#include <boost/container/map.hpp>

namespace dhtscan {

	struct entry;

	namespace entry_types {

		using dictionary_type = boost::container::map<std::string, entry, std::less<>>;
		using string_type = std::string;
		using list_type = std::vector<entry>;
		using integer_type = std::int64_t;
		struct uninitialized_type {
			bool operator==(uninitialized_type const&) const { return true; }
		};

		using variant_type = std::variant<integer_type
			, string_type
			, list_type
			, dictionary_type
			, uninitialized_type>;
	}

	// The ``entry`` class represents one node in a bencoded hierarchy. It works
	// as a variant type, it can be either a list, a dictionary (``std::map``),
	// an integer or a string.
	struct DHTSCAN_EXPORT entry : entry_types::variant_type
	{
		using dictionary_type = entry_types::dictionary_type;
		using string_type = entry_types::string_type;
		using list_type = entry_types::list_type;
		using integer_type = entry_types::integer_type;
		using uninitialized_type = entry_types::uninitialized_type;

		using variant_type = entry_types::variant_type;

		// the types an entry can have
		enum data_type
		{
			int_t,
			string_t,
			list_t,
			dictionary_t,
			undefined_t
		};

		// returns the concrete type of the entry
		data_type type() const;

		// constructors directly from a specific type.
		// The content of the argument is copied into the
		// newly constructed entry
		entry(dictionary_type); // NOLINT
		entry(std::string_view); // NOLINT
		entry(string_type); // NOLINT
		entry(list_type); // NOLINT
		entry(integer_type); // NOLINT

		// a template so that a literal 0 does not become ambiguous between
		// integer_type and char const*
		template <typename U, typename Cond = typename std::enable_if<
			std::is_same<U, char const*>::value>::type>
		entry(U v) // NOLINT
			: variant_type(string_type(v)) {}

		// construct an empty entry of the specified type.
		entry(data_type t); // NOLINT

		entry(entry const& e);
		entry(entry&& e) noexcept;

		// construct an undefined entry
		entry();

		~entry();

		entry& operator=(entry const&) &;
		entry& operator=(entry&&) &;
		entry& operator=(dictionary_type) &;
		entry& operator=(std::string_view) &;
		entry& operator=(string_type) &;
		template <typename U, typename Cond = typename std::enable_if<
			std::is_same<U, char const*>::value>::type>
		entry& operator=(U v) &
		{
			*this = string_type(v);
			return *this;
		}
		entry& operator=(list_type) &;
		entry& operator=(integer_type) &;

		// The ``integer()``, ``string()``, ``list()`` and ``dict()`` functions
		// are accessors that return the respective type. If the ``entry`` object
		// isn't of the type you request, the accessor will throw
		// system_error with ``errors::invalid_entry_type``. The non-const
		// accessors turn an undefined entry into the requested type.
		integer_type& integer();
		integer_type const& integer() const;
		string_type& string();
		string_type const& string() const;
		list_type& list();
		list_type const& list() const;
		dictionary_type& dict();
		dictionary_type const& dict() const;

		// All of these functions requires the entry to be a dictionary, if it
		// isn't they will throw ``system_error``.
		//
		// The non-const versions of the ``operator[]`` will return a reference
		// to either the existing element at the given key or, if there is no
		// element with the given key, a reference to a newly inserted element
		// at that key.
		//
		// The const version of ``operator[]`` will only return a reference to an
		// existing element at the given key. If the key is not found, it will
		// throw ``system_error``.
		entry& operator[](std::string_view key);
		entry const& operator[](std::string_view key) const;

		// These functions requires the entry to be a dictionary, if it isn't
		// they will throw ``system_error``.
		//
		// They will look for an element at the given key in the dictionary, if
		// the element cannot be found, they will return nullptr. If an element
		// with the given key is found, the return a pointer to it.
		entry* find_key(std::string_view key);
		entry const* find_key(std::string_view key) const;

	private:

		template <typename T> T& get();
		template <typename T> T const& get() const;
	};

	DHTSCAN_EXPORT bool operator==(entry const& lhs, entry const& rhs);
	inline bool operator!=(entry const& lhs, entry const& rhs) { return !(lhs == rhs); }
}

#endif // DHTSCAN_ENTRY_HPP_INCLUDED
