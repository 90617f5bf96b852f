/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/config.hpp"
#include "meshxfer/assert.hpp"

#if MESHXFER_USE_ASSERTS

#include <cstdio>
#include <cstdlib>

namespace meshxfer {

	[[noreturn]] void assert_fail(char const* expr, int const line
		, char const* file, char const* function)
	{
		std::fprintf(stderr, "assertion failed. Please file a bugreport at "
			"the meshxfer issue tracker.\n\n"
			"file: '%s'\n"
			"line: %d\n"
			"function: %s\n"
			"expression: %s\n"
			"version: %s\n"
			, file, line, function, expr, MESHXFER_VERSION);

		std::fflush(stderr);
		std::abort();
	}

}

#endif
