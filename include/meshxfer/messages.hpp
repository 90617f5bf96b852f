/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_MESSAGES_HPP_INCLUDED
#define MESHXFER_MESSAGES_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/error_code.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace meshxfer {

	// sent by the sender to announce a file. Integrity metadata is either a
	// Merkle root over the piece hashes, or the list of piece hashes (or
	// neither). All hashes are hex encoded SHA-256 digests.
	struct MESHXFER_EXPORT file_start
	{
		std::string filename;
		std::int64_t total_size = 0;
		std::int64_t piece_size = 0;
		std::optional<std::string> merkle_root;
		std::vector<std::string> piece_hashes;
	};

	// carries the content of one piece
	struct MESHXFER_EXPORT piece_data
	{
		std::uint32_t piece_index = 0;
		std::vector<char> data;
	};

	// sent by the receiver, listing the pieces it still needs and the ones
	// it holds
	struct MESHXFER_EXPORT resume_request
	{
		std::vector<std::uint32_t> missing_indices;
		std::vector<std::uint32_t> acknowledged_indices;
	};

	// acknowledges a single piece. Peers accept it but the protocol does not
	// depend on it, acknowledgements are carried in resume requests.
	struct MESHXFER_EXPORT acknowledgement
	{
		std::uint32_t piece_index = 0;
	};

	using message = std::variant<file_start, piece_data, resume_request, acknowledgement>;

	// sizes travel as 32 bit integers, a file_start can't announce anything
	// larger than this
	constexpr std::int64_t max_announced_size = 0xffffffff;

	// returns a short name for the message held in ``m``, for logging
	MESHXFER_EXPORT char const* message_name(message const& m);

	// serializes a message into an ``akita.AkitaMessage`` protobuf envelope,
	// ready for the transport. A field that does not fit the wire type (a
	// size of 4 GiB or more, a negative size) is never cut short, ``ec`` is
	// set to ``errors::message_unrepresentable`` and an empty buffer is
	// returned. The overload without an error_code throws system_error.
	MESHXFER_EXPORT std::vector<char> encode_message(message const& m, error_code& ec);
	MESHXFER_EXPORT std::vector<char> encode_message(message const& m);

	// parses a buffer produced by encode_message(). An empty buffer fails
	// with ``errors::message_truncated``. A buffer that is not a protobuf
	// envelope, or carries no known payload, fails with
	// ``errors::invalid_message``. No message is returned on failure.
	MESHXFER_EXPORT std::optional<message> decode_message(char const* buf
		, std::size_t len, error_code& ec);

	MESHXFER_EXPORT std::optional<message> decode_message(
		std::vector<char> const& buf, error_code& ec);
}

#endif // MESHXFER_MESSAGES_HPP_INCLUDED
