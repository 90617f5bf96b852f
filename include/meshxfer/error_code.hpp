/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_ERROR_CODE_HPP_INCLUDED
#define MESHXFER_ERROR_CODE_HPP_INCLUDED

#include "meshxfer/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <string>

namespace meshxfer {

	namespace errors {

		// meshxfer uses boost.system's ``error_code`` class to represent
		// errors. meshxfer has its own error category meshxfer_category()
		// with the error codes defined by error_code_enum.
		enum error_code_enum
		{
			// Not an error
			no_error = 0,
			// A hash string is not 64 hexadecimal digits
			malformed_hash,
			// The reassembled file does not have the advertised size
			size_mismatch,
			// A piece required to reassemble the file is absent
			missing_piece,
			// The piece size of a transfer is zero or outside the allowed range
			invalid_piece_size,
			// The file exceeds the configured maximum file size
			file_too_large,
			// A piece index is outside ``[0, num_pieces)``
			invalid_piece_index,
			// ``start_transfer()`` was called with an empty path
			empty_path,
			// The file to send could not be opened or read
			file_unreadable,
			// The transport refused or failed to send a message
			send_failed,
			// The storage backend failed to persist a completed file
			save_failed,
			// A received buffer is not a valid protocol message
			invalid_message,
			// A received buffer ends in the middle of a message
			message_truncated,
			// A sender or receiver was constructed without a transport or
			// storage capability
			missing_capability,
			// No piece arrived for longer than the inactivity timeout
			timed_out_inactivity,
			// A piece was requested ``max_retries`` times without arriving
			retries_exhausted,
			// A piece failed to send too many times in a row
			too_many_send_failures,
			// Received pieces repeatedly failed the Merkle root check
			integrity_check_failed,
			// There is no transfer with the specified id
			no_such_transfer,
			// A message field does not fit its wire representation
			message_unrepresentable,

			// the number of error codes
			error_code_max
		};

		// hidden
		MESHXFER_EXPORT boost::system::error_code make_error_code(error_code_enum e);

	} // namespace errors

	// return the instance of the meshxfer_error_category which
	// maps meshxfer error codes to human readable error messages.
	MESHXFER_EXPORT boost::system::error_category& meshxfer_category();

	using error_code = boost::system::error_code;
	using system_error = boost::system::system_error;
	using boost::system::generic_category;
	using boost::system::system_category;

	// internal
	MESHXFER_EXTRA_EXPORT std::string print_error(error_code const& ec);

} // namespace meshxfer

namespace boost { namespace system {

	template<> struct is_error_code_enum<meshxfer::errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif // MESHXFER_ERROR_CODE_HPP_INCLUDED
