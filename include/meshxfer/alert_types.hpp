/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_ALERT_TYPES_HPP_INCLUDED
#define MESHXFER_ALERT_TYPES_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/alert.hpp"
#include "meshxfer/error_code.hpp"
#include "meshxfer/time.hpp"

#include <bitset>
#include <cstdarg>
#include <cstdint>
#include <string>
#include <vector>

namespace meshxfer {

	// internal
	constexpr int num_alert_types = 10;

	// returns a string literal naming the alert type
	MESHXFER_EXPORT char const* alert_name(int alert_type);

#define MESHXFER_DEFINE_ALERT(name, seq) \
	static const int alert_type = seq; \
	int type() const noexcept override { return alert_type; } \
	alert_category_t category() const noexcept override { return static_category; } \
	char const* what() const noexcept override { return alert_name(alert_type); }

	// This is a base class for alerts that are associated with a specific
	// transfer. ``transfer_id`` identifies the transfer. For the sender it is
	// the recipient node, for the receiver the id returned by
	// receiver::transfer_id().
	struct MESHXFER_EXPORT transfer_alert : alert
	{
		// internal
		explicit transfer_alert(std::string id);

		std::string message() const override;

		std::string const transfer_id;
	};

	// This alert is posted by events specific to a transfer. It's meant to be
	// used for trouble shooting and debugging. It's not enabled by the
	// default alert mask and is enabled by the ``alert_category::transfer_log``
	// bit.
	struct MESHXFER_EXPORT transfer_log_alert final : transfer_alert
	{
		// internal
		transfer_log_alert(std::string id, char const* fmt, va_list v)
			MESHXFER_FORMAT(3, 0);

		MESHXFER_DEFINE_ALERT(transfer_log_alert, 0)

		static constexpr alert_category_t static_category = alert_category::transfer_log;
		std::string message() const override;

		// returns the log message
		char const* log_message() const { return m_msg.c_str(); }

	private:
		std::string m_msg;
	};

	// posted by the receiver when it accepts a file announcement and starts
	// collecting pieces
	struct MESHXFER_EXPORT file_start_alert final : transfer_alert
	{
		// internal
		file_start_alert(std::string id, std::string name, std::int64_t size
			, std::uint32_t pieces, bool broadcast);

		MESHXFER_DEFINE_ALERT(file_start_alert, 1)

		static constexpr alert_category_t static_category = alert_category::status;
		std::string message() const override;

		std::string const filename;
		std::int64_t const total_size;
		std::uint32_t const num_pieces;
		bool const is_broadcast;
	};

	// posted by the receiver once a file has been verified and handed to
	// storage
	struct MESHXFER_EXPORT file_saved_alert final : transfer_alert
	{
		// internal
		file_saved_alert(std::string id, std::string name, std::int64_t size
			, time_duration elapsed);

		MESHXFER_DEFINE_ALERT(file_saved_alert, 2)

		static constexpr alert_category_t static_category = alert_category::status;
		std::string message() const override;

		std::string const filename;
		std::int64_t const size;

		// the time from the file start message until the file was saved
		time_duration const elapsed;
	};

	// posted when a transfer is abandoned. ``error`` says why, e.g.
	// ``errors::retries_exhausted`` or ``errors::timed_out_inactivity``.
	struct MESHXFER_EXPORT transfer_failed_alert final : transfer_alert
	{
		// internal
		transfer_failed_alert(std::string id, std::string name, error_code e);

		MESHXFER_DEFINE_ALERT(transfer_failed_alert, 3)

		static constexpr alert_category_t static_category = alert_category::error;
		std::string message() const override;

		std::string const filename;
		error_code const error;
	};

	// posted by the receiver when received pieces fail verification. If the
	// file is verified by a Merkle root, the failing pieces can't be told
	// apart and every piece is listed.
	struct MESHXFER_EXPORT hash_failed_alert final : transfer_alert
	{
		// internal
		hash_failed_alert(std::string id, std::vector<std::uint32_t> p, bool merkle);

		MESHXFER_DEFINE_ALERT(hash_failed_alert, 4)

		static constexpr alert_category_t static_category = alert_category::status;
		std::string message() const override;

		std::vector<std::uint32_t> const pieces;
		bool const merkle_root_mismatch;
	};

	// posted when the transport fails to send a message. ``piece`` is the
	// piece that failed to send, or -1 for control messages.
	struct MESHXFER_EXPORT send_failed_alert final : transfer_alert
	{
		// internal
		send_failed_alert(std::string id, std::int64_t p, error_code e);

		MESHXFER_DEFINE_ALERT(send_failed_alert, 5)

		static constexpr alert_category_t static_category = alert_category::error;
		std::string message() const override;

		std::int64_t const piece;
		error_code const error;
	};

	// posted by the receiver each time it sends a resume request, and by the
	// sender each time it handles one
	struct MESHXFER_EXPORT resume_request_alert final : transfer_alert
	{
		// internal
		resume_request_alert(std::string id, int missing, int acked, bool incoming);

		MESHXFER_DEFINE_ALERT(resume_request_alert, 6)

		static constexpr alert_category_t static_category = alert_category::piece_progress;
		std::string message() const override;

		int const num_missing;
		int const num_acknowledged;

		// true if the request was received, false if it was sent
		bool const incoming;
	};

	// posted by the sender when the recipient has acknowledged every piece
	struct MESHXFER_EXPORT transfer_complete_alert final : transfer_alert
	{
		// internal
		transfer_complete_alert(std::string id, std::string name);

		MESHXFER_DEFINE_ALERT(transfer_complete_alert, 7)

		static constexpr alert_category_t static_category = alert_category::status;
		std::string message() const override;

		std::string const filename;
	};

	// posted by the sender when it slows down the pace of pieces to a
	// recipient that keeps reporting losses
	struct MESHXFER_EXPORT send_rate_alert final : transfer_alert
	{
		// internal
		send_rate_alert(std::string id, milliseconds d);

		MESHXFER_DEFINE_ALERT(send_rate_alert, 8)

		static constexpr alert_category_t static_category = alert_category::performance_warning;
		std::string message() const override;

		milliseconds const delay;
	};

	// this alert is posted to indicate to the client that some alerts were
	// dropped. Dropped meaning that the alert failed to be delivered to the
	// client. The most common cause of such failure is that the internal alert
	// queue grew too big (controlled by alert_queue_size).
	struct MESHXFER_EXPORT alerts_dropped_alert final : alert
	{
		// internal
		explicit alerts_dropped_alert(std::bitset<num_alert_types> const& dropped);

		MESHXFER_DEFINE_ALERT(alerts_dropped_alert, 9)

		static constexpr alert_category_t static_category = alert_category::error;
		std::string message() const override;

		// a bitmask indicating which alerts were dropped. Each bit represents
		// the alert type ID, where bit 0 represents whether any alert of type 0
		// has been dropped, and so on.
		std::bitset<num_alert_types> const dropped_alerts;
	};

#undef MESHXFER_DEFINE_ALERT

}

#endif // MESHXFER_ALERT_TYPES_HPP_INCLUDED
