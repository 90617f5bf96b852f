/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_TIME_HPP_INCLUDED
#define MESHXFER_TIME_HPP_INCLUDED

#include "meshxfer/config.hpp"

#include <chrono>
#include <cstdint>

namespace meshxfer {

	using clock_type = std::chrono::steady_clock;

	using time_point = clock_type::time_point;
	using time_duration = clock_type::duration;

	using seconds = std::chrono::seconds;
	using milliseconds = std::chrono::milliseconds;
	using microseconds = std::chrono::microseconds;
	using std::chrono::duration_cast;

	// internal
	inline time_point min_time() { return (time_point::min)(); }

	template<class T>
	std::int64_t total_seconds(T td)
	{ return duration_cast<seconds>(td).count(); }

	template<class T>
	std::int64_t total_milliseconds(T td)
	{ return duration_cast<milliseconds>(td).count(); }

namespace aux {

	inline time_point time_now() { return clock_type::now(); }

}
}

#endif // MESHXFER_TIME_HPP_INCLUDED
