/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_CONFIG_HPP_INCLUDED
#define MESHXFER_CONFIG_HPP_INCLUDED

#include <boost/config.hpp>
#include <boost/version.hpp>

#if defined MESHXFER_BUILDING_SHARED
# define MESHXFER_EXPORT BOOST_SYMBOL_EXPORT
#elif defined MESHXFER_LINKING_SHARED
# define MESHXFER_EXPORT BOOST_SYMBOL_IMPORT
#endif

#ifndef MESHXFER_EXPORT
# define MESHXFER_EXPORT
#endif

#ifndef MESHXFER_EXTRA_EXPORT
# define MESHXFER_EXTRA_EXPORT MESHXFER_EXPORT
#endif

#ifndef MESHXFER_USE_ASSERTS
#define MESHXFER_USE_ASSERTS 0
#endif

#define MESHXFER_UNUSED(x) (void)(x)

#if defined __GNUC__ || defined __clang__
#define MESHXFER_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define MESHXFER_FORMAT(fmt, ellipsis)
#endif

#define MESHXFER_VERSION "1.0.0"

namespace meshxfer {}
namespace mx = meshxfer;

#endif // MESHXFER_CONFIG_HPP_INCLUDED
