/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_RECEIVER_HPP_INCLUDED
#define MESHXFER_RECEIVER_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/error_code.hpp"
#include "meshxfer/messages.hpp"
#include "meshxfer/settings_pack.hpp"
#include "meshxfer/backoff_policy.hpp"
#include "meshxfer/transfer_registry.hpp"
#include "meshxfer/time.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshxfer {

	class alert_manager;
	struct transport_interface;
	struct storage_interface;

namespace aux {
	struct receiver_transfer;
}

	// a snapshot of an incoming transfer, as returned by receiver::status()
	struct MESHXFER_EXPORT receiver_status
	{
		std::string filename;
		std::string origin;
		std::int64_t total_size = 0;
		std::int64_t piece_size = 0;
		std::uint32_t num_pieces = 0;
		std::uint32_t num_received = 0;

		// indices not yet received, in ascending order
		std::vector<std::uint32_t> missing;

		// indices asked for in the last resume request and not received
		// since
		std::vector<std::uint32_t> requested;

		bool is_broadcast = false;

		// the number of times every piece was dropped because the assembled
		// pieces did not match the advertised Merkle root
		int merkle_failures = 0;

		// the number of pieces dropped for not matching their advertised
		// hash. Once one index fails ``max_retries`` times, the transfer
		// fails with ``errors::integrity_check_failed``
		int hash_failures = 0;
	};

	// the receiving half of the protocol. A receiver tracks one transfer per
	// transfer id (see transfer_id()). Transfers are removed once the file
	// has been saved or the transfer failed. When a direct (not broadcast)
	// transfer is saved, its origin is sent a resume request acknowledging
	// every piece.
	//
	// The receiver does not run a clock of its own. The client is expected to
	// call tick() periodically (about once a second) to drive resume requests
	// and inactivity timeouts. All functions may be called from any thread.
	class MESHXFER_EXPORT receiver
	{
	public:

		// throws system_error (``errors::missing_capability``) if either
		// ``transport`` or ``storage`` is null.
		receiver(std::shared_ptr<transport_interface> transport
			, std::shared_ptr<storage_interface> storage
			, alert_manager& alerts
			, settings_pack const& s = settings_pack());

		receiver(receiver const&) = delete;
		receiver& operator=(receiver const&) = delete;

		~receiver();

		// the key incoming transfers from ``origin`` are tracked under.
		// Broadcast transfers are kept apart from direct ones.
		static std::string transfer_id(std::string const& origin, bool is_broadcast);

		// starts tracking the file announced by ``origin``, replacing any
		// transfer with the same id. Announcements with an invalid piece size
		// or a file that's too large are dropped. An empty file is saved
		// right away.
		void handle_file_start(std::string const& origin, file_start const& fs
			, bool is_broadcast = false);

		// stores a piece and, once every piece is in, verifies and saves the
		// file.
		void handle_piece_data(std::string const& origin, piece_data const& pd
			, bool is_broadcast = false);

		// returns the indices of transfer ``id`` that still need to be
		// requested. If one of them has been requested ``max_retries`` times
		// already, the transfer fails and an empty set is returned.
		std::set<std::uint32_t> check_for_missing_or_corrupt(std::string const& id);

		// asks the origin of transfer ``id`` for the pieces in ``missing``,
		// acknowledging every piece held. Does nothing for broadcast
		// transfers. Returns the send error, if any.
		error_code send_resume_request(std::string const& id
			, std::set<std::uint32_t> const& missing);

		// times out idle transfers and sends resume requests for transfers
		// whose request interval has elapsed.
		void tick(time_point now = aux::time_now());

		// decodes a payload received from ``origin`` and dispatches it.
		// Returns the decode error, if any.
		error_code incoming_packet(std::string const& origin
			, std::vector<char> const& payload, bool is_broadcast = false);

		std::optional<receiver_status> status(std::string const& id) const;

		int num_transfers() const;

		settings_pack const& settings() const { return m_settings; }

	private:

		void check_and_assemble(std::string const& id);
		void fail_transfer(std::string const& id, std::string const& filename
			, error_code const& ec);
		// returns false if the file could not be saved
		bool save_file(std::string const& id, std::string const& filename
			, std::vector<char> const& data, time_point start_time);

		// tells the origin every piece arrived
		void send_completion(std::string const& id, std::string const& origin
			, std::uint32_t num_pieces);

		void debug_log(std::string const& id, char const* fmt, ...) const
			MESHXFER_FORMAT(3, 4);

		std::shared_ptr<transport_interface> m_transport;
		std::shared_ptr<storage_interface> m_storage;
		alert_manager& m_alerts;
		settings_pack const m_settings;
		retry_policy const m_retry;
		seconds const m_request_interval;
		seconds const m_inactivity_timeout;
		int const m_channel;

		std::atomic<std::uint64_t> m_next_generation{0};

		mutable aux::transfer_registry<aux::receiver_transfer> m_transfers;
	};
}

#endif // MESHXFER_RECEIVER_HPP_INCLUDED
