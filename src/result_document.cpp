/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <cerrno>
#include <fstream>

#include <boost/json.hpp>
// the library is used header-only
#include <boost/json/src.hpp>

#include "dhtscan/result_document.hpp"
#include "dhtscan/socket_io.hpp"
#include "dhtscan/time.hpp"

namespace json = boost::json;

namespace dhtscan {

namespace {

	// json::serialize() has no indentation, this lays the document out the
	// way Python's json.dump(indent=4) does
	void pretty_print(std::string& out, json::value const& jv, int indent)
	{
		switch (jv.kind())
		{
			case json::kind::object:
			{
				json::object const& obj = jv.get_object();
				if (obj.empty())
				{
					out += "{}";
					break;
				}
				out += "{\n";
				indent += 4;
				bool first = true;
				for (auto const& kv : obj)
				{
					if (!first) out += ",\n";
					first = false;
					out.append(std::size_t(indent), ' ');
					out += json::serialize(json::value(kv.key()));
					out += ": ";
					pretty_print(out, kv.value(), indent);
				}
				indent -= 4;
				out += '\n';
				out.append(std::size_t(indent), ' ');
				out += '}';
				break;
			}
			case json::kind::array:
			{
				json::array const& arr = jv.get_array();
				if (arr.empty())
				{
					out += "[]";
					break;
				}
				out += "[\n";
				indent += 4;
				bool first = true;
				for (auto const& v : arr)
				{
					if (!first) out += ",\n";
					first = false;
					out.append(std::size_t(indent), ' ');
					pretty_print(out, v, indent);
				}
				indent -= 4;
				out += '\n';
				out.append(std::size_t(indent), ' ');
				out += ']';
				break;
			}
			default:
				out += json::serialize(jv);
				break;
		}
	}
}

	std::string write_result_document(scan_result const& r)
	{
		json::object doc;
		doc["date_crawling"] = iso8601_time(r.date_crawling);

		for (auto const& h : r.hashes)
		{
			json::array& peers = doc[h.hex].emplace_array();
			for (auto const& p : h.peers)
				peers.emplace_back(print_endpoint(p));
		}

		std::string ret;
		pretty_print(ret, doc, 0);
		return ret;
	}

	void save_result_document(scan_result const& r, std::string const& path)
	{
		error_code ec;
		save_result_document(r, path, ec);
		if (ec) throw system_error(ec, path);
	}

	void save_result_document(scan_result const& r, std::string const& path
		, error_code& ec)
	{
		ec.clear();
		std::string const doc = write_result_document(r);

		std::ofstream f(path, std::ios::binary | std::ios::trunc);
		if (!f)
		{
			ec.assign(errno != 0 ? errno : EIO, generic_category());
			return;
		}
		f.write(doc.data(), std::streamsize(doc.size()));
		f.close();
		if (!f) ec.assign(errno != 0 ? errno : EIO, generic_category());
	}
}
