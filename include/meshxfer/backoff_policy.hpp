/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_BACKOFF_POLICY_HPP_INCLUDED
#define MESHXFER_BACKOFF_POLICY_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/settings_pack.hpp"
#include "meshxfer/time.hpp"

#include <algorithm>

namespace meshxfer {

	// decides how the sender paces pieces to a recipient. Each resume request
	// reporting missing pieces bumps a counter. When the counter reaches
	// ``retry_threshold`` the delay between pieces grows by 50%, up to
	// ``max_delay``, and the counter starts over.
	struct pacing_policy
	{
		pacing_policy(int threshold, milliseconds initial, milliseconds min_d
			, milliseconds max_d)
			: retry_threshold(threshold)
			, initial_delay(initial)
			, min_delay(min_d)
			, max_delay(max_d)
		{}

		explicit pacing_policy(settings_pack const& s)
			: pacing_policy(s.get_int(settings_pack::retry_threshold)
				, milliseconds(s.get_int(settings_pack::initial_send_delay))
				, milliseconds(s.get_int(settings_pack::min_send_delay))
				, milliseconds(s.get_int(settings_pack::max_send_delay)))
		{}

		bool should_escalate(int const retry_count) const
		{ return retry_count >= retry_threshold; }

		milliseconds next_delay(milliseconds const current) const
		{
			milliseconds const grown(current.count() * 3 / 2);
			return std::max(min_delay, std::min(grown, max_delay));
		}

		// the delay a new transfer starts out with
		milliseconds start_delay() const
		{ return std::max(min_delay, std::min(initial_delay, max_delay)); }

		int retry_threshold;
		milliseconds initial_delay;
		milliseconds min_delay;
		milliseconds max_delay;
	};

	// decides when the receiver gives up on a piece
	struct retry_policy
	{
		explicit retry_policy(int const max)
			: max_retries(max)
		{}

		explicit retry_policy(settings_pack const& s)
			: retry_policy(s.get_int(settings_pack::max_retries))
		{}

		// true if a piece that has been requested ``retry_count`` times
		// should not be requested again
		bool exhausted(int const retry_count) const
		{ return retry_count >= max_retries; }

		int max_retries;
	};
}

#endif // MESHXFER_BACKOFF_POLICY_HPP_INCLUDED
