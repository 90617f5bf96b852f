/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_ASSERT_HPP_INCLUDED
#define MESHXFER_ASSERT_HPP_INCLUDED

#include "meshxfer/config.hpp"

#if MESHXFER_USE_ASSERTS

#include <cstdio>
#include <string>

namespace meshxfer {

	[[noreturn]] MESHXFER_EXPORT void assert_fail(char const* expr, int line
		, char const* file, char const* function);

}

#define MESHXFER_ASSERT(x) do { if (x) {} else \
	::meshxfer::assert_fail(#x, __LINE__, __FILE__, __func__); } while (false)

#define MESHXFER_ASSERT_VAL(x, y) do { if (x) {} else { \
	std::fprintf(stderr, "%s = %s\n", #y, std::to_string(y).c_str()); \
	::meshxfer::assert_fail(#x, __LINE__, __FILE__, __func__); } } while (false)

#else

#define MESHXFER_ASSERT(a) do {} while (false)
#define MESHXFER_ASSERT_VAL(a, b) do {} while (false)

#endif

#endif // MESHXFER_ASSERT_HPP_INCLUDED
