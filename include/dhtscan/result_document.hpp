/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_RESULT_DOCUMENT_HPP_INCLUDED
#define DHTSCAN_RESULT_DOCUMENT_HPP_INCLUDED

#include <string>

#include "dhtscan/config.hpp"
#include "dhtscan/error_code.hpp"
#include "dhtscan/scanner.hpp"

namespace dhtscan {

	// renders a scan result as a JSON object, indented by 4 spaces:
	//
	// .. code:: json
	//
	// 	{
	// 	    "date_crawling": "2026-10-17T12:30:05.123456",
	// 	    "<info-hash>": [
	// 	        "1.2.3.4:6881"
	// 	    ]
	// 	}
	//
	// the info-hashes appear in scan order, each with its peers as
	// "ip:port" strings. Equal results always render to the same bytes.
	DHTSCAN_EXPORT std::string write_result_document(scan_result const& r);

	// writes the document to ``path``, replacing the file. The throwing
	// version throws system_error
	DHTSCAN_EXPORT void save_result_document(scan_result const& r
		, std::string const& path);
	DHTSCAN_EXPORT void save_result_document(scan_result const& r
		, std::string const& path, error_code& ec);
}

#endif // DHTSCAN_RESULT_DOCUMENT_HPP_INCLUDED
