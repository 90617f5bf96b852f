/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/config.hpp"
#include "meshxfer/error_code.hpp"

#include <sstream>

namespace meshxfer {

	struct meshxfer_error_category final : boost::system::error_category
	{
		char const* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	char const* meshxfer_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "meshxfer";
	}

	std::string meshxfer_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"malformed hash",
			"reassembled size does not match advertised size",
			"missing piece",
			"invalid piece size",
			"file too large",
			"invalid piece index",
			"empty file path",
			"file could not be read",
			"transport failed to send message",
			"failed to save file",
			"invalid message",
			"message truncated",
			"missing transport or storage capability",
			"transfer timed out due to inactivity",
			"maximum retries exceeded for piece",
			"too many consecutive send failures",
			"integrity check failed",
			"no such transfer",
			"message field cannot be represented on the wire",
		};
		static_assert(sizeof(msgs) / sizeof(msgs[0]) == errors::error_code_max
			, "message table out of sync with error_code_enum");
		if (ev < 0 || ev >= int(sizeof(msgs) / sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	boost::system::error_category& meshxfer_category()
	{
		static meshxfer_error_category meshxfer_category;
		return meshxfer_category;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, meshxfer_category()};
		}
	}

	std::string print_error(error_code const& ec)
	{
		if (!ec) return {};
		std::stringstream ret;
		ret << "ERROR: (" << ec.category().name() << ":" << ec.value() << ") "
			<< ec.message();
		return ret.str();
	}

} // namespace meshxfer
