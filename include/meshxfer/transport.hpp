/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_TRANSPORT_HPP_INCLUDED
#define MESHXFER_TRANSPORT_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/error_code.hpp"

#include <string>
#include <vector>

namespace meshxfer {

	// the radio link a sender or receiver talks over. Delivery is best
	// effort, a successful return only means the message was handed to the
	// radio. Implementations must be safe to call from multiple threads.
	struct MESHXFER_EXPORT transport_interface
	{
		// send ``payload`` to the node ``destination`` on ``channel``.
		// Returns an error if the message could not be queued for sending.
		virtual error_code send(std::string const& destination
			, std::vector<char> const& payload, int channel) = 0;

	protected:
		~transport_interface() = default;
	};

	// where the receiver puts completed files. Implementations must be safe to
	// call from multiple threads.
	struct MESHXFER_EXPORT storage_interface
	{
		// persist ``data`` under the name ``filename``. The filename is the
		// one announced by the remote sender and must not be trusted.
		virtual error_code save(std::string const& filename
			, std::vector<char> const& data) = 0;

	protected:
		~storage_interface() = default;
	};
}

#endif // MESHXFER_TRANSPORT_HPP_INCLUDED
