/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_ALERT_MANAGER_HPP_INCLUDED
#define MESHXFER_ALERT_MANAGER_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/alert.hpp"
#include "meshxfer/alert_types.hpp" // for num_alert_types
#include "meshxfer/time.hpp"

#include <array>
#include <atomic>
#include <bitset>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <new>
#include <utility> // for std::forward
#include <vector>

namespace meshxfer {

	// queues the alerts posted by the senders and receivers of a node until
	// the client collects them with get_all(). Alerts may be posted from any
	// thread. Once ``queue_limit`` alerts are waiting (see
	// settings_pack::alert_queue_size), further ones are dropped and an
	// alerts_dropped_alert is appended to the next batch.
	class MESHXFER_EXPORT alert_manager
	{
	public:
		explicit alert_manager(int queue_limit
			, alert_category_t alert_mask = alert_category::error);

		alert_manager(alert_manager const&) = delete;
		alert_manager& operator=(alert_manager const&) = delete;

		~alert_manager();

		template <class T, typename... Args>
		void emplace_alert(Args&&... args) try
		{
			std::lock_guard<std::mutex> l(m_mutex);
			auto& queue = m_queue[m_active];
			if (int(queue.size()) >= m_queue_limit)
			{
				m_dropped.set(T::alert_type);
				return;
			}
			queue.push_back(std::make_unique<T>(std::forward<Args>(args)...));
			if (queue.size() == 1) m_posted.notify_all();
		}
		catch (std::bad_alloc const&)
		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_dropped.set(T::alert_type);
		}

		template <class T>
		bool should_post() const
		{
			return (m_alert_mask.load(std::memory_order_relaxed) & T::static_category) != 0;
		}

		// hands every queued alert to the caller. The alert objects stay
		// valid until the next call to get_all()
		void get_all(std::vector<alert*>& alerts);

		// blocks until an alert is queued or ``max_wait`` has passed.
		// Returns the first queued alert, without removing it, or nullptr on
		// timeout.
		alert* wait_for_alert(time_duration max_wait);

		void set_alert_mask(alert_category_t const m) noexcept { m_alert_mask = m; }
		alert_category_t alert_mask() const noexcept { return m_alert_mask; }

		int alert_queue_size_limit() const noexcept { return m_queue_limit; }

	private:

		mutable std::mutex m_mutex;
		std::condition_variable m_posted;
		std::atomic<alert_category_t> m_alert_mask;
		int const m_queue_limit;

		// one bit per alert type dropped since the last get_all()
		std::bitset<num_alert_types> m_dropped;

		// alerts are posted to m_queue[m_active]. get_all() flips m_active,
		// the other queue holds the alerts last handed to the client
		int m_active = 0;
		std::array<std::vector<std::unique_ptr<alert>>, 2> m_queue;
	};
}

#endif // MESHXFER_ALERT_MANAGER_HPP_INCLUDED
