/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_TEST_UTILS_HPP
#define MESHXFER_TEST_UTILS_HPP

#include "meshxfer/alert_manager.hpp"
#include "meshxfer/alert_types.hpp"
#include "meshxfer/error_code.hpp"
#include "meshxfer/messages.hpp"
#include "meshxfer/settings_pack.hpp"
#include "meshxfer/transport.hpp"

#include <cerrno>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_utils {

	using meshxfer::error_code;

	// a message handed to a transport
	struct sent_packet
	{
		std::string destination;
		std::vector<char> payload;
		int channel;
	};

	// records every message and reports success. If ``fail_after`` is
	// non-negative, every send after that many successful ones fails with
	// ``error``. ``on_send`` is called first, without holding the lock. If it
	// returns an error, the message is not recorded and the send fails.
	struct recording_transport final : meshxfer::transport_interface
	{
		error_code send(std::string const& destination
			, std::vector<char> const& payload, int channel) override
		{
			if (on_send)
			{
				error_code const ec = on_send(payload);
				if (ec)
				{
					std::lock_guard<std::mutex> l(mutex);
					++num_failed;
					return ec;
				}
			}
			std::lock_guard<std::mutex> l(mutex);
			if (throw_on_send) throw std::runtime_error("radio unplugged");
			if (fail_after >= 0 && int(packets.size()) >= fail_after)
			{
				++num_failed;
				return error;
			}
			packets.push_back({destination, payload, channel});
			return {};
		}

		// the decoded messages sent so far
		std::vector<meshxfer::message> messages() const
		{
			std::lock_guard<std::mutex> l(mutex);
			std::vector<meshxfer::message> ret;
			for (auto const& p : packets)
			{
				error_code ec;
				auto m = meshxfer::decode_message(p.payload, ec);
				if (m) ret.push_back(std::move(*m));
			}
			return ret;
		}

		template <typename T>
		std::vector<T> messages_of_type() const
		{
			std::vector<T> ret;
			for (auto const& m : messages())
				if (auto const* t = std::get_if<T>(&m)) ret.push_back(*t);
			return ret;
		}

		std::vector<sent_packet> take()
		{
			std::lock_guard<std::mutex> l(mutex);
			std::vector<sent_packet> ret;
			ret.swap(packets);
			return ret;
		}

		int num_sent() const
		{
			std::lock_guard<std::mutex> l(mutex);
			return int(packets.size());
		}

		mutable std::mutex mutex;
		std::vector<sent_packet> packets;
		int fail_after = -1;
		int num_failed = 0;
		bool throw_on_send = false;
		error_code error = meshxfer::errors::send_failed;
		std::function<error_code(std::vector<char> const&)> on_send;
	};

	// a storage backend keeping saved files in memory
	struct memory_storage final : meshxfer::storage_interface
	{
		error_code save(std::string const& filename
			, std::vector<char> const& data) override
		{
			std::lock_guard<std::mutex> l(mutex);
			++num_saves;
			if (fail) return error_code(EIO, meshxfer::generic_category());
			files[filename] = data;
			return {};
		}

		mutable std::mutex mutex;
		std::map<std::string, std::vector<char>> files;
		int num_saves = 0;
		bool fail = false;
	};

	// settings suitable for tests, no pacing delay and small pieces
	inline meshxfer::settings_pack test_settings()
	{
		meshxfer::settings_pack s;
		s.set_int(meshxfer::settings_pack::initial_send_delay, 0);
		s.set_int(meshxfer::settings_pack::min_send_delay, 0);
		s.set_int(meshxfer::settings_pack::piece_size, 1024);
		return s;
	}

	// deterministic, non-repeating test content
	inline std::vector<char> make_content(std::size_t const size, std::uint32_t seed = 0x1337)
	{
		std::vector<char> ret(size);
		for (auto& c : ret)
		{
			seed = seed * 1103515245u + 12345u;
			c = char(seed >> 16);
		}
		return ret;
	}

	inline void clear_alerts(meshxfer::alert_manager& mgr)
	{
		std::vector<meshxfer::alert*> alerts;
		mgr.get_all(alerts);
	}

	// drains the alert queue. Returns the number of alerts of type T in it,
	// passing each one to ``f``
	template <typename T>
	int count_alerts(meshxfer::alert_manager& mgr
		, std::function<void(T const&)> const& f = {})
	{
		std::vector<meshxfer::alert*> alerts;
		mgr.get_all(alerts);
		int ret = 0;
		for (auto const* a : alerts)
		{
			auto const* t = meshxfer::alert_cast<T>(a);
			if (t == nullptr) continue;
			++ret;
			if (f) f(*t);
		}
		return ret;
	}
}

#endif // MESHXFER_TEST_UTILS_HPP
