/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_THROW_HPP_INCLUDED
#define MESHXFER_THROW_HPP_INCLUDED

#include <exception>
#include <utility> // for forward()

#include "meshxfer/config.hpp"

namespace meshxfer::aux {

	template <typename T, typename... Args>
#ifdef BOOST_NO_EXCEPTIONS
	[[noreturn]] void throw_ex(Args&&...) {
		std::terminate();
	}
#else
	[[noreturn]] void throw_ex(Args&&... args) {
		throw T(std::forward<Args>(args)...);
	}
#endif
}

#endif
