/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_SENDER_HPP_INCLUDED
#define MESHXFER_SENDER_HPP_INCLUDED

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
#include <string>
#include <vector>

namespace meshxfer {

	class alert_manager;
	struct transport_interface;
	struct byte_source;

namespace aux {
	struct sender_transfer;
}

	// the state of an outgoing transfer
	enum class sender_state : std::uint8_t
	{
		// pieces are being sent or resent on request
		sending,

		// the receiver acknowledged every piece
		complete,

		// a piece failed to send ``max_send_failures`` times in a row. No
		// more pieces are sent
		gave_up
	};

	MESHXFER_EXPORT char const* sender_state_name(sender_state s);

	// a snapshot of an outgoing transfer, as returned by sender::status()
	struct MESHXFER_EXPORT sender_status
	{
		std::string filename;
		std::int64_t total_size = 0;
		int piece_size = 0;
		std::uint32_t num_pieces = 0;

		// the number of pieces the receiver has acknowledged
		std::uint32_t num_acknowledged = 0;

		sender_state state = sender_state::sending;

		// the current delay between two pieces sent to this recipient
		milliseconds send_delay{0};

		// consecutive resume requests reporting missing pieces since the
		// delay was last adjusted
		int retry_count = 0;

		// true if the file start advertised a Merkle root rather than the
		// list of piece hashes
		bool has_merkle_root = false;
	};

	// the sending half of the protocol. A sender holds at most one transfer
	// per recipient. Starting a new transfer to a recipient replaces the
	// previous one.
	//
	// Sending is synchronous, start_transfer() and handle_resume_request()
	// return once every piece they send has been handed to the transport,
	// pausing the current pacing delay after each one. The sender may be
	// used from multiple threads, e.g. one driving start_transfer() while
	// another feeds it incoming resume requests.
	class MESHXFER_EXPORT sender
	{
	public:

		// throws system_error (``errors::missing_capability``) if
		// ``transport`` is null.
		sender(std::shared_ptr<transport_interface> transport
			, alert_manager& alerts
			, settings_pack const& s = settings_pack());

		sender(sender const&) = delete;
		sender& operator=(sender const&) = delete;

		~sender();

		// reads the file at ``path``, announces it to ``recipient`` and
		// sends every piece once. On failure ``ec`` is set and no transfer
		// is stored. The file is announced under the last element of
		// ``path``. A file the announcement can't describe (4 GiB or more,
		// a name that isn't UTF-8) fails with
		// ``errors::message_unrepresentable``.
		void start_transfer(std::string const& recipient
			, std::string const& path, error_code& ec);

		// same as above, but reads the content from ``src`` and announces
		// it as ``filename``.
		void start_transfer(std::string const& recipient
			, std::string const& filename, byte_source& src, error_code& ec);

		// sends the pieces in ``indices`` to ``recipient``, in order. Stops
		// early if the transfer is replaced, cleaned up or gives up.
		void send_pieces(std::string const& recipient
			, std::vector<std::uint32_t> const& indices);

		// processes a resume request received from ``origin``. Records the
		// acknowledged pieces, adjusts the pacing delay and resends the
		// missing pieces.
		void handle_resume_request(std::string const& origin
			, resume_request const& req);

		// decodes a payload received from ``origin`` and dispatches it.
		// Returns the decode error, if any. Messages a sender doesn't act on
		// are ignored.
		error_code incoming_packet(std::string const& origin
			, std::vector<char> const& payload);

		// forgets the transfer to ``recipient``. Returns false if there was
		// none.
		bool cleanup_transfer(std::string const& recipient);

		std::optional<sender_status> status(std::string const& recipient) const;

		int num_transfers() const;

		settings_pack const& settings() const { return m_settings; }

	private:

		error_code send_message(std::string const& recipient
			, std::vector<char> const& payload);

		void debug_log(std::string const& id, char const* fmt, ...) const
			MESHXFER_FORMAT(3, 4);

		std::shared_ptr<transport_interface> m_transport;
		alert_manager& m_alerts;
		settings_pack const m_settings;
		pacing_policy const m_pacing;
		int const m_max_send_failures;
		int const m_channel;

		std::atomic<std::uint64_t> m_next_generation{0};

		// mutable for status()
		mutable aux::transfer_registry<aux::sender_transfer> m_transfers;
	};
}

#endif // MESHXFER_SENDER_HPP_INCLUDED
