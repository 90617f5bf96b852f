/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/config.hpp"
#include "meshxfer/alert.hpp"
#include "meshxfer/alert_types.hpp"
#include "meshxfer/assert.hpp"

#include <algorithm>
#include <array>
#include <cinttypes> // for PRId64 et.al.
#include <cstdio>

namespace meshxfer {

	alert::alert() : m_timestamp(clock_type::now()) {}
	alert::~alert() = default;
	time_point alert::timestamp() const { return m_timestamp; }

	transfer_alert::transfer_alert(std::string id)
		: transfer_id(std::move(id))
	{}

	std::string transfer_alert::message() const
	{
		return transfer_id.empty() ? std::string("-") : transfer_id;
	}

	transfer_log_alert::transfer_log_alert(std::string id, char const* fmt, va_list v)
		: transfer_alert(std::move(id))
	{
		char buf[1024];
		int const len = std::vsnprintf(buf, sizeof(buf), fmt, v);
		if (len > 0) m_msg.assign(buf, std::min(std::size_t(len), sizeof(buf) - 1));
	}

	std::string transfer_log_alert::message() const
	{
		return transfer_alert::message() + ": " + m_msg;
	}

	file_start_alert::file_start_alert(std::string id, std::string name
		, std::int64_t const size, std::uint32_t const pieces, bool const broadcast)
		: transfer_alert(std::move(id))
		, filename(std::move(name))
		, total_size(size)
		, num_pieces(pieces)
		, is_broadcast(broadcast)
	{}

	std::string file_start_alert::message() const
	{
		char msg[400];
		std::snprintf(msg, sizeof(msg), "%s: file start \"%s\" (%" PRId64 " bytes, %u pieces)%s"
			, transfer_alert::message().c_str(), filename.c_str(), total_size
			, num_pieces, is_broadcast ? " [broadcast]" : "");
		return msg;
	}

	file_saved_alert::file_saved_alert(std::string id, std::string name
		, std::int64_t const s, time_duration const e)
		: transfer_alert(std::move(id))
		, filename(std::move(name))
		, size(s)
		, elapsed(e)
	{}

	std::string file_saved_alert::message() const
	{
		char msg[400];
		std::snprintf(msg, sizeof(msg), "%s: saved \"%s\" (%" PRId64 " bytes) in %" PRId64 " ms"
			, transfer_alert::message().c_str(), filename.c_str(), size
			, total_milliseconds(elapsed));
		return msg;
	}

	transfer_failed_alert::transfer_failed_alert(std::string id, std::string name
		, error_code e)
		: transfer_alert(std::move(id))
		, filename(std::move(name))
		, error(e)
	{}

	std::string transfer_failed_alert::message() const
	{
		return transfer_alert::message() + ": transfer of \"" + filename
			+ "\" failed: " + error.message();
	}

	hash_failed_alert::hash_failed_alert(std::string id
		, std::vector<std::uint32_t> p, bool const merkle)
		: transfer_alert(std::move(id))
		, pieces(std::move(p))
		, merkle_root_mismatch(merkle)
	{}

	std::string hash_failed_alert::message() const
	{
		char msg[200];
		std::snprintf(msg, sizeof(msg), "%s: %s, re-requesting %d pieces"
			, transfer_alert::message().c_str()
			, merkle_root_mismatch ? "merkle root mismatch" : "piece hash mismatch"
			, int(pieces.size()));
		return msg;
	}

	send_failed_alert::send_failed_alert(std::string id, std::int64_t const p
		, error_code e)
		: transfer_alert(std::move(id))
		, piece(p)
		, error(e)
	{}

	std::string send_failed_alert::message() const
	{
		char msg[300];
		if (piece < 0)
		{
			std::snprintf(msg, sizeof(msg), "%s: failed to send control message: %s"
				, transfer_alert::message().c_str(), error.message().c_str());
		}
		else
		{
			std::snprintf(msg, sizeof(msg), "%s: failed to send piece %" PRId64 ": %s"
				, transfer_alert::message().c_str(), piece, error.message().c_str());
		}
		return msg;
	}

	resume_request_alert::resume_request_alert(std::string id, int const missing
		, int const acked, bool const in)
		: transfer_alert(std::move(id))
		, num_missing(missing)
		, num_acknowledged(acked)
		, incoming(in)
	{}

	std::string resume_request_alert::message() const
	{
		char msg[200];
		std::snprintf(msg, sizeof(msg), "%s: %s resume request (missing: %d acknowledged: %d)"
			, transfer_alert::message().c_str(), incoming ? "received" : "sent"
			, num_missing, num_acknowledged);
		return msg;
	}

	transfer_complete_alert::transfer_complete_alert(std::string id, std::string name)
		: transfer_alert(std::move(id))
		, filename(std::move(name))
	{}

	std::string transfer_complete_alert::message() const
	{
		return transfer_alert::message() + ": all pieces of \"" + filename
			+ "\" acknowledged";
	}

	send_rate_alert::send_rate_alert(std::string id, milliseconds const d)
		: transfer_alert(std::move(id))
		, delay(d)
	{}

	std::string send_rate_alert::message() const
	{
		char msg[200];
		std::snprintf(msg, sizeof(msg), "%s: pieces keep getting lost, delay "
			"between pieces increased to %d ms"
			, transfer_alert::message().c_str(), int(delay.count()));
		return msg;
	}

	alerts_dropped_alert::alerts_dropped_alert(std::bitset<num_alert_types> const& dropped)
		: dropped_alerts(dropped)
	{}

	std::string alerts_dropped_alert::message() const
	{
		std::string ret = "dropped alerts: ";

		for (int idx = 0; idx < num_alert_types; ++idx)
		{
			if (!dropped_alerts.test(std::size_t(idx))) continue;
			ret += alert_name(idx);
			ret += ' ';
		}

		return ret;
	}

	char const* alert_name(int const alert_type)
	{
		static std::array<char const*, num_alert_types> const names = {{
			"transfer_log", "file_start", "file_saved", "transfer_failed",
			"hash_failed", "send_failed", "resume_request", "transfer_complete",
			"send_rate", "alerts_dropped"
		}};

		MESHXFER_ASSERT(alert_type >= 0);
		MESHXFER_ASSERT(alert_type < num_alert_types);
		if (alert_type < 0 || alert_type >= num_alert_types) return "";
		return names[std::size_t(alert_type)];
	}
}
