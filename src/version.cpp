/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "dhtscan/version.hpp"

namespace dhtscan {

char const* version()
{
	return version_str;
}

}
