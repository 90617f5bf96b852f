/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/alert_manager.hpp"
#include "meshxfer/alert_types.hpp"

namespace meshxfer {

	alert_manager::alert_manager(int const queue_limit, alert_category_t const alert_mask)
		: m_alert_mask(alert_mask)
		, m_queue_limit(queue_limit)
	{}

	alert_manager::~alert_manager() = default;

	alert* alert_manager::wait_for_alert(time_duration const max_wait)
	{
		std::unique_lock<std::mutex> l(m_mutex);
		if (!m_posted.wait_for(l, max_wait, [this] { return !m_queue[m_active].empty(); }))
			return nullptr;
		return m_queue[m_active].front().get();
	}

	void alert_manager::get_all(std::vector<alert*>& alerts)
	{
		alerts.clear();
		std::lock_guard<std::mutex> l(m_mutex);

		auto& queue = m_queue[m_active];
		if (queue.empty()) return;

		// the client learns about drops in the same batch the queue filled up
		if (m_dropped.any())
		{
			queue.push_back(std::make_unique<alerts_dropped_alert>(m_dropped));
			m_dropped.reset();
		}

		alerts.reserve(queue.size());
		for (auto const& a : queue) alerts.push_back(a.get());

		// the alerts handed out last time are released here
		m_active ^= 1;
		m_queue[m_active].clear();
	}
}
