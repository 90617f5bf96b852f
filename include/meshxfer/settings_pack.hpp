/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_SETTINGS_PACK_HPP_INCLUDED
#define MESHXFER_SETTINGS_PACK_HPP_INCLUDED

#include "meshxfer/config.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// OVERVIEW
//
// The sender and receiver are configured by passing a settings_pack to their
// constructors. A settings_pack only holds the values that have been set
// explicitly, reading any other setting returns its default value.
//
// Settings are addressed by enum. Every setting also has a name, which is
// the name of its enum value, used by setting_by_name(), name_for_setting()
// and load_config().
namespace meshxfer {

	struct settings_pack;

	// converts a setting name (as a string) into the integer value
	// identifying the setting. Returns -1 if there is no setting with
	// that name.
	MESHXFER_EXPORT int setting_by_name(std::string const& name);

	// returns the name of the setting with the id ``s``, or an empty string
	// for unknown ids.
	MESHXFER_EXPORT char const* name_for_setting(int s);

	// returns a settings_pack with every setting set to its default value
	MESHXFER_EXPORT settings_pack default_settings();

	// The ``settings_pack`` struct, contains the names of all settings as
	// enum values. These values are passed in to the ``set_int()`` and
	// ``set_bool()`` functions, to specify the setting to change.
	struct MESHXFER_EXPORT settings_pack
	{
		// set a configuration option in the settings_pack. ``name`` is one of
		// the enum values from int_types or bool_types. They must match the
		// type of the set function.
		void set_int(int name, int val);
		void set_bool(int name, bool val);

		// queries whether the specified configuration option has a value set
		// in this pack.
		bool has_val(int name) const;

		// clear the settings pack from all settings
		void clear();

		// clear a specific setting from the pack
		void clear(int name);

		// queries the current configuration option from the settings_pack.
		// Settings that have not been set return their default.
		int get_int(int name) const;
		bool get_bool(int name) const;

		// returns the number of settings explicitly set in this pack
		int size() const { return int(m_ints.size() + m_bools.size()); }

		// internal
		template <typename Fun>
		void for_each(Fun&& f) const
		{
			for (auto const& i : m_ints) f(i.first, i.second);
			for (auto const& b : m_bools) f(b.first, b.second);
		}

		enum type_bases
		{
			int_type_base =    0x4000,
			bool_type_base =   0x8000,
			type_mask =        0xc000,
			index_mask =       0x3fff
		};

		enum bool_types : std::uint16_t
		{
			// when true, the sender advertises the Merkle root of the piece
			// hashes in the file start message. When false (or when the root
			// cannot be computed), the full list of piece hashes is sent
			// instead.
			use_merkle_root = bool_type_base,

			max_bool_setting_internal
		};

		enum int_types : std::uint16_t
		{
			// the size, in bytes, a sender splits files into. It is clamped to
			// [min_piece_size, max_piece_size] and to the file size.
			piece_size = int_type_base,

			// the bounds a receiver accepts for the piece size advertised by
			// a sender.
			min_piece_size,
			max_piece_size,

			// the largest file, in MiB, a sender will send or a receiver
			// will accept
			max_file_size_mib,

			// the number of times a receiver requests a single piece before
			// it gives up on the whole transfer
			max_retries,

			// the number of seconds between resume requests sent by the
			// receiver while pieces are missing
			resume_request_interval,

			// if no piece arrives for this many seconds, the receiver drops
			// the transfer
			inactivity_timeout,

			// the sender's pacing delay between pieces, in milliseconds. The
			// delay starts at ``initial_send_delay`` and grows, when the
			// receiver keeps reporting losses, up to ``max_send_delay``.
			initial_send_delay,
			min_send_delay,
			max_send_delay,

			// the number of consecutive resume requests with missing pieces
			// before the sender slows down
			retry_threshold,

			// the number of consecutive send failures on a single piece
			// before the sender gives up on the transfer
			max_send_failures,

			// the transport channel (port number) all protocol messages are
			// sent on
			transport_channel,

			// the max number of alerts queued up by the alert_manager
			alert_queue_size,

			max_int_setting_internal
		};

		constexpr static int num_bool_settings = int(max_bool_setting_internal) - int(bool_type_base);
		constexpr static int num_int_settings = int(max_int_setting_internal) - int(int_type_base);

	private:

		std::vector<std::pair<std::uint16_t, int>> m_ints;
		std::vector<std::pair<std::uint16_t, bool>> m_bools;
	};

	// the max file size setting, in bytes
	MESHXFER_EXPORT std::int64_t max_file_size(settings_pack const& s);
}

#endif // MESHXFER_SETTINGS_PACK_HPP_INCLUDED
