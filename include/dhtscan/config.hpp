/*

Copyright (c) 2026, dhtscan authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef DHTSCAN_CONFIG_HPP_INCLUDED
#define DHTSCAN_CONFIG_HPP_INCLUDED

#include <boost/config.hpp>

// dhtscan is built as a static library. The export macros are kept so that
// declarations read the same whether or not a shared build is added later
#define DHTSCAN_EXPORT
#define DHTSCAN_EXTRA_EXPORT

#if defined __GNUC__ || defined __clang__
#define DHTSCAN_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define DHTSCAN_FORMAT(fmt, ellipsis)
#endif

#if !defined DHTSCAN_USE_ASSERTS && !defined NDEBUG
#define DHTSCAN_USE_ASSERTS 1
#endif

#ifndef DHTSCAN_USE_ASSERTS
#define DHTSCAN_USE_ASSERTS 0
#endif

#ifndef DHTSCAN_USE_IOSTREAM
#define DHTSCAN_USE_IOSTREAM 1
#endif

#endif // DHTSCAN_CONFIG_HPP_INCLUDED
