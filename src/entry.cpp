/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/entry.hpp"

namespace dhtscan {

namespace {
	[[noreturn]] inline void throw_error()
	{
		throw system_error(errors::invalid_entry_type);
	}
} // anonymous namespace

	template <typename T>
	T& entry::get()
	{
		if (std::holds_alternative<uninitialized_type>(*this)) emplace<T>();
		else if (!std::holds_alternative<T>(*this)) throw_error();
		return std::get<T>(*this);
	}

	template <typename T>
	T const& entry::get() const
	{
		if (!std::holds_alternative<T>(*this)) throw_error();
		return std::get<T>(*this);
	}

	entry& entry::operator[](std::string_view key)
	{
		auto& d = dict();
		auto const i = d.find(key);
		if (i != d.end()) return i->second;
		return d[std::string(key)];
	}

	entry const& entry::operator[](std::string_view key) const
	{
		auto const i = dict().find(key);
		if (i == dict().end()) throw_error();
		return i->second;
	}

	entry* entry::find_key(std::string_view key)
	{
		auto const i = dict().find(key);
		if (i == dict().end()) return nullptr;
		return &i->second;
	}

	entry const* entry::find_key(std::string_view key) const
	{
		auto const i = dict().find(key);
		if (i == dict().end()) return nullptr;
		return &i->second;
	}

	entry::data_type entry::type() const
	{
		return static_cast<entry::data_type>(index());
	}

	entry::~entry() = default;

	entry& entry::operator=(entry const& e) & = default;
	entry& entry::operator=(entry&& e) & = default;

	entry& entry::operator=(dictionary_type v) &
	{
		variant_type::operator=(std::move(v));
		return *this;
	}

	entry& entry::operator=(std::string_view v) &
	{
		variant_type::operator=(std::string(v));
		return *this;
	}

	entry& entry::operator=(string_type v) &
	{
		variant_type::operator=(std::move(v));
		return *this;
	}

	entry& entry::operator=(list_type v) &
	{
		variant_type::operator=(std::move(v));
		return *this;
	}

	entry& entry::operator=(integer_type v) &
	{
		variant_type::operator=(v);
		return *this;
	}

	entry::integer_type& entry::integer() { return get<integer_type>(); }
	entry::integer_type const& entry::integer() const { return get<integer_type>(); }
	entry::string_type& entry::string() { return get<string_type>(); }
	entry::string_type const& entry::string() const { return get<string_type>(); }
	entry::list_type& entry::list() { return get<list_type>(); }
	entry::list_type const& entry::list() const { return get<list_type>(); }
	entry::dictionary_type& entry::dict() { return get<dictionary_type>(); }
	entry::dictionary_type const& entry::dict() const { return get<dictionary_type>(); }

	entry::entry() : variant_type(uninitialized_type{}) {}

	entry::entry(data_type t)
		: variant_type(uninitialized_type{})
	{
		switch (t)
		{
			case int_t: emplace<integer_type>(); break;
			case string_t: emplace<string_type>(); break;
			case list_t: emplace<list_type>(); break;
			case dictionary_t: emplace<dictionary_type>(); break;
			case undefined_t: break;
		}
	}

	entry::entry(entry const& e) = default;
	entry::entry(entry&& e) noexcept = default;

	entry::entry(dictionary_type v) : variant_type(std::move(v)) {}
	entry::entry(string_type v) : variant_type(std::move(v)) {}
	entry::entry(std::string_view v) : variant_type(std::string(v)) {}
	entry::entry(list_type v) : variant_type(std::move(v)) {}
	entry::entry(integer_type v) : variant_type(v) {}

	bool operator==(entry const& lhs, entry const& rhs)
	{
		return static_cast<entry::variant_type const&>(lhs)
			== static_cast<entry::variant_type const&>(rhs);
	}
}
