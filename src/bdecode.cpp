/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/bdecode.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace dhtscan {

	struct bdecode_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* bdecode_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "bdecode";
	}

	std::string bdecode_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"expected digit in bencoded string",
			"expected colon in bencoded string",
			"unexpected end of file in bencoded string",
			"expected value (list, dict, int or string) in bencoded string",
			"bencoded nesting depth exceeded",
			"bencoded item count limit exceeded",
			"integer overflow",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	boost::system::error_category& bdecode_category()
	{
		static bdecode_error_category bdecode_category;
		return bdecode_category;
	}

	namespace bdecode_errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, bdecode_category()};
		}
	}

namespace {

	bool is_digit(char const c) { return c >= '0' && c <= '9'; }

	struct decoder
	{
		decoder(span<char const> buf, int depth, int tokens, error_code& e)
			: cur(buf.data())
			, begin(buf.data())
			, end(buf.data() + buf.size())
			, depth_limit(depth)
			, tokens_left(tokens)
			, ec(e)
		{}

		bool fail(bdecode_errors::error_code_enum const e)
		{
			ec = e;
			return false;
		}

		// parses a non-negative decimal number terminated by ``delimiter``.
		// ``cur`` is left pointing at the delimiter
		bool parse_uint(char const delimiter, std::int64_t& val
			, bdecode_errors::error_code_enum const missing_delimiter)
		{
			val = 0;
			if (cur == end) return fail(bdecode_errors::unexpected_eof);
			if (!is_digit(*cur)) return fail(bdecode_errors::expected_digit);
			while (cur != end && *cur != delimiter)
			{
				if (!is_digit(*cur)) return fail(missing_delimiter);
				int const digit = *cur - '0';
				if (val > (std::numeric_limits<std::int64_t>::max() - digit) / 10)
					return fail(bdecode_errors::overflow);
				val = val * 10 + digit;
				++cur;
			}
			if (cur == end) return fail(bdecode_errors::unexpected_eof);
			return true;
		}

		bool decode_string(std::string& out)
		{
			std::int64_t len = 0;
			if (!parse_uint(':', len, bdecode_errors::expected_colon)) return false;
			// skip the colon
			++cur;
			if (len > end - cur) return fail(bdecode_errors::unexpected_eof);
			out.assign(cur, std::size_t(len));
			cur += len;
			return true;
		}

		bool decode(entry& ret, int const depth)
		{
			if (depth >= depth_limit) return fail(bdecode_errors::depth_exceeded);
			if (cur == end) return fail(bdecode_errors::unexpected_eof);
			if (--tokens_left < 0) return fail(bdecode_errors::limit_exceeded);

			switch (*cur)
			{
			case 'i':
			{
				++cur;
				bool negative = false;
				if (cur != end && *cur == '-')
				{
					negative = true;
					++cur;
				}
				std::int64_t val = 0;
				if (!parse_uint('e', val, bdecode_errors::expected_digit)) return false;
				// skip the 'e'
				++cur;
				ret = negative ? -val : val;
				return true;
			}
			case 'l':
			{
				++cur;
				ret = entry(entry::list_t);
				auto& l = ret.list();
				for (;;)
				{
					if (cur == end) return fail(bdecode_errors::unexpected_eof);
					if (*cur == 'e') break;
					l.emplace_back();
					if (!decode(l.back(), depth + 1)) return false;
				}
				++cur;
				return true;
			}
			case 'd':
			{
				++cur;
				ret = entry(entry::dictionary_t);
				auto& d = ret.dict();
				for (;;)
				{
					if (cur == end) return fail(bdecode_errors::unexpected_eof);
					if (*cur == 'e') break;
					if (!is_digit(*cur)) return fail(bdecode_errors::expected_digit);
					if (--tokens_left < 0) return fail(bdecode_errors::limit_exceeded);
					std::string key;
					if (!decode_string(key)) return false;
					entry val;
					if (!decode(val, depth + 1)) return false;
					d[std::move(key)] = std::move(val);
				}
				++cur;
				return true;
			}
			default:
				if (!is_digit(*cur)) return fail(bdecode_errors::expected_value);
				{
					std::string str;
					if (!decode_string(str)) return false;
					ret = std::move(str);
				}
				return true;
			}
		}

		char const* cur;
		char const* const begin;
		char const* const end;
		int const depth_limit;
		int tokens_left;
		error_code& ec;
	};

} // anonymous namespace

	entry bdecode(span<char const> buffer, error_code& ec, int* error_pos
		, int const depth_limit, int const token_limit)
	{
		ec.clear();
		entry ret;
		decoder d(buffer, depth_limit, token_limit, ec);
		if (!d.decode(ret, 0))
		{
			if (error_pos) *error_pos = int(d.cur - d.begin);
			return entry();
		}
		if (error_pos) *error_pos = 0;
		return ret;
	}

	entry bdecode(span<char const> buffer, int const depth_limit, int const token_limit)
	{
		error_code ec;
		entry ret = bdecode(buffer, ec, nullptr, depth_limit, token_limit);
		if (ec) throw system_error(ec);
		return ret;
	}
}
