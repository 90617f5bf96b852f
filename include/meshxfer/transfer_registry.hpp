/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_TRANSFER_REGISTRY_HPP_INCLUDED
#define MESHXFER_TRANSFER_REGISTRY_HPP_INCLUDED

#include "meshxfer/config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace meshxfer::aux {

	// the set of live transfers of one role (sender or receiver), keyed by
	// transfer id. A single mutex guards the map and every field of every
	// transfer in it. Transfers are only reachable from inside the closures
	// passed to with_transfer() and for_each(), which run with the mutex
	// held, so no reference to a transfer outlives the lock.
	//
	// T must provide ``bool releasable() const``. A transfer that reports true
	// after a closure has run on it is removed from the registry.
	//
	// The mutex is not recursive, closures must not call back into the
	// registry. They also must not block (send, sleep or save). Collect what
	// needs to be done and do it once the closure has returned.
	template <typename T>
	struct transfer_registry
	{
		// adds ``t`` under ``id``, replacing (and destroying) any transfer
		// already there. Returns true if one was replaced.
		bool insert(std::string const& id, std::unique_ptr<T> t)
		{
			std::lock_guard<std::mutex> l(m_mutex);
			auto const i = m_transfers.find(id);
			if (i != m_transfers.end())
			{
				i->second = std::move(t);
				return true;
			}
			m_transfers.emplace(id, std::move(t));
			return false;
		}

		// returns true if a transfer was removed
		bool remove(std::string const& id)
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return m_transfers.erase(id) > 0;
		}

		bool contains(std::string const& id) const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return m_transfers.count(id) > 0;
		}

		int size() const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return int(m_transfers.size());
		}

		std::vector<std::string> ids() const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			std::vector<std::string> ret;
			ret.reserve(m_transfers.size());
			for (auto const& e : m_transfers) ret.push_back(e.first);
			return ret;
		}

		// runs ``f(T&)`` on the transfer with the specified id, under the
		// lock. If ``f`` returns a value, it is returned wrapped in an
		// optional, which is empty if there is no such transfer. If ``f``
		// returns void, the return value says whether ``f`` ran.
		template <typename Fun>
		auto with_transfer(std::string const& id, Fun&& f)
		{
			using ret_t = std::invoke_result_t<Fun&, T&>;

			std::lock_guard<std::mutex> l(m_mutex);
			auto const i = m_transfers.find(id);
			if constexpr (std::is_void_v<ret_t>)
			{
				if (i == m_transfers.end()) return false;
				f(*i->second);
				release_if_done(i);
				return true;
			}
			else
			{
				if (i == m_transfers.end()) return std::optional<ret_t>();
				std::optional<ret_t> ret(f(*i->second));
				release_if_done(i);
				return ret;
			}
		}

		// runs ``f(std::string const& id, T&)`` on every transfer, under the
		// lock
		template <typename Fun>
		void for_each(Fun&& f)
		{
			std::lock_guard<std::mutex> l(m_mutex);
			for (auto i = m_transfers.begin(); i != m_transfers.end();)
			{
				f(i->first, *i->second);
				if (i->second->releasable()) i = m_transfers.erase(i);
				else ++i;
			}
		}

	private:

		using map_t = std::map<std::string, std::unique_ptr<T>>;

		void release_if_done(typename map_t::iterator const i)
		{
			if (i->second->releasable()) m_transfers.erase(i);
		}

		mutable std::mutex m_mutex;
		map_t m_transfers;
	};
}

#endif // MESHXFER_TRANSFER_REGISTRY_HPP_INCLUDED
