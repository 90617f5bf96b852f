/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/settings_pack.hpp"
#include "meshxfer/assert.hpp"

#include <algorithm>
#include <array>

namespace meshxfer {

namespace {

	template <class T>
	bool compare_first(std::pair<std::uint16_t, T> const& lhs
		, std::pair<std::uint16_t, T> const& rhs)
	{
		return lhs.first < rhs.first;
	}

	template <class T>
	void insort_replace(std::vector<std::pair<std::uint16_t, T>>& c
		, std::pair<std::uint16_t, T> v)
	{
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == v.first) i->second = std::move(v.second);
		else c.emplace(i, std::move(v));
	}

	struct int_setting_entry_t
	{
		// the name of this setting. used for serialization and deserialization
		char const* name;
		// the value used when the setting is not set in a pack
		int default_value;
	};

	struct bool_setting_entry_t
	{
		char const* name;
		bool default_value;
	};

#define SET(name, default_value) { #name, default_value }

	std::array<bool_setting_entry_t, settings_pack::num_bool_settings> const bool_settings
	{{
		SET(use_merkle_root, true),
	}};

	std::array<int_setting_entry_t, settings_pack::num_int_settings> const int_settings
	{{
		SET(piece_size, 1024),
		SET(min_piece_size, 64),
		SET(max_piece_size, 1024 * 1024),
		SET(max_file_size_mib, 10 * 1024),
		SET(max_retries, 3),
		SET(resume_request_interval, 10),
		SET(inactivity_timeout, 300),
		SET(initial_send_delay, 200),
		SET(min_send_delay, 50),
		SET(max_send_delay, 1000),
		SET(retry_threshold, 3),
		SET(max_send_failures, 5),
		SET(transport_channel, 123),
		SET(alert_queue_size, 1000),
	}};

#undef SET

} // anonymous namespace

	int setting_by_name(std::string const& key)
	{
		for (int k = 0; k < int(int_settings.size()); ++k)
		{
			if (key != int_settings[std::size_t(k)].name) continue;
			return settings_pack::int_type_base + k;
		}
		for (int k = 0; k < int(bool_settings.size()); ++k)
		{
			if (key != bool_settings[std::size_t(k)].name) continue;
			return settings_pack::bool_type_base + k;
		}
		return -1;
	}

	char const* name_for_setting(int const s)
	{
		std::size_t const idx = std::size_t(s & settings_pack::index_mask);
		switch (s & settings_pack::type_mask)
		{
			case settings_pack::int_type_base:
				if (idx >= int_settings.size()) return "";
				return int_settings[idx].name;
			case settings_pack::bool_type_base:
				if (idx >= bool_settings.size()) return "";
				return bool_settings[idx].name;
		}
		return "";
	}

	settings_pack default_settings()
	{
		settings_pack ret;
		for (int i = 0; i < settings_pack::num_int_settings; ++i)
		{
			ret.set_int(settings_pack::int_type_base + i
				, int_settings[std::size_t(i)].default_value);
		}
		for (int i = 0; i < settings_pack::num_bool_settings; ++i)
		{
			ret.set_bool(settings_pack::bool_type_base + i
				, bool_settings[std::size_t(i)].default_value);
		}
		return ret;
	}

	void settings_pack::set_int(int const name, int const val)
	{
		MESHXFER_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return;
		if ((name & index_mask) >= num_int_settings) return;
		insort_replace(m_ints, std::pair<std::uint16_t, int>(std::uint16_t(name), val));
	}

	void settings_pack::set_bool(int const name, bool const val)
	{
		MESHXFER_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return;
		if ((name & index_mask) >= num_bool_settings) return;
		insort_replace(m_bools, std::pair<std::uint16_t, bool>(std::uint16_t(name), val));
	}

	bool settings_pack::has_val(int const name) const
	{
		switch (name & type_mask)
		{
			case int_type_base:
			{
				std::pair<std::uint16_t, int> v(std::uint16_t(name), 0);
				auto i = std::lower_bound(m_ints.begin(), m_ints.end(), v
					, &compare_first<int>);
				return i != m_ints.end() && i->first == name;
			}
			case bool_type_base:
			{
				std::pair<std::uint16_t, bool> v(std::uint16_t(name), false);
				auto i = std::lower_bound(m_bools.begin(), m_bools.end(), v
					, &compare_first<bool>);
				return i != m_bools.end() && i->first == name;
			}
		}
		MESHXFER_ASSERT(false);
		return false;
	}

	int settings_pack::get_int(int const name) const
	{
		MESHXFER_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return 0;
		std::size_t const idx = std::size_t(name & index_mask);
		if (idx >= int_settings.size()) return 0;

		// this is an optimization. If the settings pack is complete,
		// i.e. has every key, we don't need to search, it's just a lookup
		if (int(m_ints.size()) == settings_pack::num_int_settings)
		{
			MESHXFER_ASSERT(m_ints[idx].first == name);
			return m_ints[idx].second;
		}
		std::pair<std::uint16_t, int> v(std::uint16_t(name), 0);
		auto i = std::lower_bound(m_ints.begin(), m_ints.end(), v
			, &compare_first<int>);
		if (i != m_ints.end() && i->first == name) return i->second;
		return int_settings[idx].default_value;
	}

	bool settings_pack::get_bool(int const name) const
	{
		MESHXFER_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return false;
		std::size_t const idx = std::size_t(name & index_mask);
		if (idx >= bool_settings.size()) return false;

		std::pair<std::uint16_t, bool> v(std::uint16_t(name), false);
		auto i = std::lower_bound(m_bools.begin(), m_bools.end(), v
			, &compare_first<bool>);
		if (i != m_bools.end() && i->first == name) return i->second;
		return bool_settings[idx].default_value;
	}

	void settings_pack::clear()
	{
		m_ints.clear();
		m_bools.clear();
	}

	void settings_pack::clear(int const name)
	{
		switch (name & type_mask)
		{
			case int_type_base:
			{
				std::pair<std::uint16_t, int> v(std::uint16_t(name), 0);
				auto const i = std::lower_bound(m_ints.begin(), m_ints.end(), v
					, &compare_first<int>);
				if (i != m_ints.end() && i->first == name) m_ints.erase(i);
				break;
			}
			case bool_type_base:
			{
				std::pair<std::uint16_t, bool> v(std::uint16_t(name), false);
				auto const i = std::lower_bound(m_bools.begin(), m_bools.end(), v
					, &compare_first<bool>);
				if (i != m_bools.end() && i->first == name) m_bools.erase(i);
				break;
			}
		}
	}

	std::int64_t max_file_size(settings_pack const& s)
	{
		return std::int64_t(s.get_int(settings_pack::max_file_size_mib)) * 1024 * 1024;
	}
}
