/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/sender.hpp"
#include "meshxfer/alert_manager.hpp"
#include "meshxfer/alert_types.hpp"
#include "meshxfer/aux_/throw.hpp"
#include "meshxfer/hasher.hpp"
#include "meshxfer/merkle.hpp"
#include "meshxfer/piece_codec.hpp"
#include "meshxfer/transport.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdarg>
#include <exception>
#include <thread>

namespace meshxfer {

namespace aux {

	struct sender_transfer
	{
		std::string filename;
		std::int64_t total_size = 0;
		int piece_size = 0;
		std::uint32_t num_pieces = 0;
		std::vector<piece> pieces;
		std::vector<std::string> piece_hashes;
		std::optional<std::string> merkle_root;

		std::vector<bool> acknowledged;

		// consecutive failed sends, per piece
		std::vector<int> send_failures;

		milliseconds delay{0};
		int retry_count = 0;
		sender_state state = sender_state::sending;

		// distinguishes this transfer from an earlier or later one to the
		// same recipient
		std::uint64_t generation = 0;

		// outgoing transfers are only removed by cleanup_transfer()
		bool releasable() const { return false; }
	};
}

namespace {

	std::string filename_from_path(std::string const& path)
	{
		auto const sep = path.find_last_of('/');
		if (sep == std::string::npos) return path;
		return path.substr(sep + 1);
	}
}

	char const* sender_state_name(sender_state const s)
	{
		switch (s)
		{
			case sender_state::sending: return "sending";
			case sender_state::complete: return "complete";
			case sender_state::gave_up: return "gave_up";
		}
		return "unknown";
	}

	sender::sender(std::shared_ptr<transport_interface> transport
		, alert_manager& alerts
		, settings_pack const& s)
		: m_transport(std::move(transport))
		, m_alerts(alerts)
		, m_settings(s)
		, m_pacing(s)
		, m_max_send_failures(s.get_int(settings_pack::max_send_failures))
		, m_channel(s.get_int(settings_pack::transport_channel))
	{
		if (!m_transport)
			aux::throw_ex<system_error>(error_code(errors::missing_capability));
	}

	sender::~sender() = default;

	void sender::start_transfer(std::string const& recipient
		, std::string const& path, error_code& ec)
	{
		ec.clear();
		if (path.empty())
		{
			ec = errors::empty_path;
			return;
		}

		std::string const filename = filename_from_path(path);
		file_source src(path, ec);
		if (ec)
		{
			debug_log(recipient, "failed to open \"%s\": %s", path.c_str()
				, ec.message().c_str());
			ec = errors::file_unreadable;
			if (m_alerts.should_post<transfer_failed_alert>())
				m_alerts.emplace_alert<transfer_failed_alert>(recipient, filename, ec);
			return;
		}
		start_transfer(recipient, filename, src, ec);
	}

	void sender::start_transfer(std::string const& recipient
		, std::string const& filename, byte_source& src, error_code& ec)
	{
		ec.clear();
		std::int64_t const total_size = src.size();

		auto fail = [&](error_code const& e)
		{
			ec = e;
			if (m_alerts.should_post<transfer_failed_alert>())
				m_alerts.emplace_alert<transfer_failed_alert>(recipient, filename, ec);
		};

		if (total_size > max_file_size(m_settings))
		{
			debug_log(recipient, "\"%s\" is too large (%" PRId64 " bytes)"
				, filename.c_str(), total_size);
			fail(errors::file_too_large);
			return;
		}
		if (total_size > max_announced_size)
		{
			debug_log(recipient, "\"%s\" can't be announced (%" PRId64 " bytes)"
				, filename.c_str(), total_size);
			fail(errors::message_unrepresentable);
			return;
		}

		auto t = std::make_unique<aux::sender_transfer>();
		t->filename = filename;
		t->total_size = total_size;
		t->piece_size = clamp_piece_size(m_settings.get_int(settings_pack::piece_size)
			, total_size, m_settings);

		error_code read_ec;
		t->pieces = split_pieces(src, t->piece_size, read_ec);
		if (read_ec)
		{
			debug_log(recipient, "failed to read \"%s\": %s", filename.c_str()
				, read_ec.message().c_str());
			fail(read_ec == errors::invalid_piece_size
				? error_code(errors::invalid_piece_size)
				: error_code(errors::file_unreadable));
			return;
		}
		t->num_pieces = std::uint32_t(t->pieces.size());

		t->piece_hashes.reserve(t->pieces.size());
		for (auto const& p : t->pieces)
			t->piece_hashes.push_back(hash_hex(p.bytes));

		if (m_settings.get_bool(settings_pack::use_merkle_root) && t->num_pieces > 0)
		{
			t->merkle_root = merkle_root(t->piece_hashes);
			if (!t->merkle_root)
				debug_log(recipient, "could not compute Merkle root, sending piece hashes");
		}

		file_start fs;
		fs.filename = filename;
		fs.total_size = total_size;
		fs.piece_size = t->piece_size;
		if (t->merkle_root) fs.merkle_root = t->merkle_root;
		else fs.piece_hashes = t->piece_hashes;

		debug_log(recipient, "starting \"%s\" (%" PRId64 " bytes, %u pieces of %d bytes)"
			, filename.c_str(), total_size, t->num_pieces, t->piece_size);

		error_code encode_ec;
		std::vector<char> const announcement = encode_message(fs, encode_ec);
		if (encode_ec)
		{
			debug_log(recipient, "failed to encode the file start for \"%s\": %s"
				, filename.c_str(), encode_ec.message().c_str());
			fail(encode_ec);
			return;
		}

		error_code const send_ec = send_message(recipient, announcement);
		if (send_ec)
		{
			if (m_alerts.should_post<send_failed_alert>())
				m_alerts.emplace_alert<send_failed_alert>(recipient, std::int64_t(-1), send_ec);
			fail(errors::send_failed);
			return;
		}

		t->acknowledged.assign(t->num_pieces, false);
		t->send_failures.assign(t->num_pieces, 0);
		t->delay = m_pacing.start_delay();
		t->generation = ++m_next_generation;
		std::uint32_t const num_pieces = t->num_pieces;
		if (num_pieces == 0) t->state = sender_state::complete;

		if (m_transfers.insert(recipient, std::move(t)))
			debug_log(recipient, "replaced the previous transfer");

		if (m_alerts.should_post<file_start_alert>())
			m_alerts.emplace_alert<file_start_alert>(recipient, filename, total_size
				, num_pieces, false);

		if (num_pieces == 0)
		{
			if (m_alerts.should_post<transfer_complete_alert>())
				m_alerts.emplace_alert<transfer_complete_alert>(recipient, filename);
			return;
		}

		std::vector<std::uint32_t> all(num_pieces);
		for (std::uint32_t i = 0; i < num_pieces; ++i) all[i] = i;
		send_pieces(recipient, all);
	}

	void sender::send_pieces(std::string const& recipient
		, std::vector<std::uint32_t> const& indices)
	{
		auto const gen = m_transfers.with_transfer(recipient
			, [](aux::sender_transfer const& t) { return t.generation; });
		if (!gen) return;

		for (auto const index : indices)
		{
			std::vector<char> payload;
			milliseconds delay{0};
			bool valid_index = true;
			bool const live = m_transfers.with_transfer(recipient
				, [&](aux::sender_transfer const& t)
			{
				if (t.generation != *gen || t.state != sender_state::sending)
					return false;
				if (index >= t.num_pieces)
				{
					valid_index = false;
					return true;
				}
				payload = encode_message(piece_data{index, t.pieces[index].bytes});
				delay = t.delay;
				return true;
			}).value_or(false);

			if (!live) break;
			if (!valid_index)
			{
				debug_log(recipient, "not sending out of range piece %u", index);
				continue;
			}

			error_code const ec = send_message(recipient, payload);

			std::string filename;
			bool gave_up = false;
			m_transfers.with_transfer(recipient, [&](aux::sender_transfer& t)
			{
				if (t.generation != *gen) return;
				if (!ec)
				{
					t.send_failures[index] = 0;
					return;
				}
				if (++t.send_failures[index] >= m_max_send_failures
					&& t.state == sender_state::sending)
				{
					t.state = sender_state::gave_up;
					filename = t.filename;
					gave_up = true;
				}
			});

			if (ec)
			{
				debug_log(recipient, "failed to send piece %u: %s", index
					, ec.message().c_str());
				if (m_alerts.should_post<send_failed_alert>())
					m_alerts.emplace_alert<send_failed_alert>(recipient
						, std::int64_t(index), ec);
			}

			if (gave_up)
			{
				debug_log(recipient, "giving up after %d failed sends of piece %u"
					, m_max_send_failures, index);
				if (m_alerts.should_post<transfer_failed_alert>())
					m_alerts.emplace_alert<transfer_failed_alert>(recipient, filename
						, errors::too_many_send_failures);
				break;
			}

			if (delay > milliseconds(0))
				std::this_thread::sleep_for(delay);
		}
	}

	void sender::handle_resume_request(std::string const& origin
		, resume_request const& req)
	{
		std::vector<std::uint32_t> missing = req.missing_indices;
		std::sort(missing.begin(), missing.end());
		missing.erase(std::unique(missing.begin(), missing.end()), missing.end());

		if (m_alerts.should_post<resume_request_alert>())
			m_alerts.emplace_alert<resume_request_alert>(origin, int(missing.size())
				, int(req.acknowledged_indices.size()), true);

		enum class outcome { ignore, completed, resend };

		std::vector<std::uint32_t> resend;
		std::size_t num_invalid = 0;
		std::string filename;
		std::optional<milliseconds> new_delay;
		sender_state state = sender_state::sending;

		auto const ret = m_transfers.with_transfer(origin, [&](aux::sender_transfer& t)
		{
			filename = t.filename;
			state = t.state;
			if (t.state != sender_state::sending) return outcome::ignore;

			for (auto const i : req.acknowledged_indices)
				if (i < t.num_pieces) t.acknowledged[i] = true;

			bool const all_acked = std::all_of(t.acknowledged.begin()
				, t.acknowledged.end(), [](bool b) { return b; });

			if (all_acked && missing.empty())
			{
				t.state = sender_state::complete;
				return outcome::completed;
			}

			if (missing.empty())
			{
				t.retry_count = 0;
				return outcome::ignore;
			}

			++t.retry_count;
			if (m_pacing.should_escalate(t.retry_count))
			{
				milliseconds const d = m_pacing.next_delay(t.delay);
				if (d > t.delay)
				{
					t.delay = d;
					new_delay = d;
				}
				t.retry_count = 0;
			}

			for (auto const i : missing)
			{
				if (i < t.num_pieces) resend.push_back(i);
				else ++num_invalid;
			}
			return outcome::resend;
		});

		if (!ret)
		{
			debug_log(origin, "resume request for unknown transfer");
			return;
		}

		switch (*ret)
		{
			case outcome::ignore:
				if (state != sender_state::sending)
					debug_log(origin, "ignoring resume request, transfer is %s"
						, sender_state_name(state));
				return;
			case outcome::completed:
				debug_log(origin, "\"%s\" acknowledged by receiver", filename.c_str());
				if (m_alerts.should_post<transfer_complete_alert>())
					m_alerts.emplace_alert<transfer_complete_alert>(origin, filename);
				return;
			case outcome::resend:
				break;
		}

		if (new_delay)
		{
			debug_log(origin, "receiver keeps losing pieces, send delay now %d ms"
				, int(new_delay->count()));
			if (m_alerts.should_post<send_rate_alert>())
				m_alerts.emplace_alert<send_rate_alert>(origin, *new_delay);
		}

		if (num_invalid > 0)
			debug_log(origin, "dropping %d out of range piece indices from resume request"
				, int(num_invalid));

		if (resend.empty()) return;
		debug_log(origin, "resending %d pieces", int(resend.size()));
		send_pieces(origin, resend);
	}

	error_code sender::incoming_packet(std::string const& origin
		, std::vector<char> const& payload)
	{
		error_code ec;
		auto const m = decode_message(payload, ec);
		if (!m)
		{
			debug_log(origin, "dropping undecodable packet: %s", ec.message().c_str());
			return ec;
		}

		if (auto const* rr = std::get_if<resume_request>(&*m))
			handle_resume_request(origin, *rr);
		else
			debug_log(origin, "ignoring %s message", message_name(*m));
		return ec;
	}

	bool sender::cleanup_transfer(std::string const& recipient)
	{
		bool const ret = m_transfers.remove(recipient);
		if (ret) debug_log(recipient, "transfer cleaned up");
		return ret;
	}

	std::optional<sender_status> sender::status(std::string const& recipient) const
	{
		return m_transfers.with_transfer(recipient, [](aux::sender_transfer const& t)
		{
			sender_status st;
			st.filename = t.filename;
			st.total_size = t.total_size;
			st.piece_size = t.piece_size;
			st.num_pieces = t.num_pieces;
			st.num_acknowledged = std::uint32_t(std::count(t.acknowledged.begin()
				, t.acknowledged.end(), true));
			st.state = t.state;
			st.send_delay = t.delay;
			st.retry_count = t.retry_count;
			st.has_merkle_root = bool(t.merkle_root);
			return st;
		});
	}

	int sender::num_transfers() const
	{
		return m_transfers.size();
	}

	error_code sender::send_message(std::string const& recipient
		, std::vector<char> const& payload)
	{
		try
		{
			error_code const ec = m_transport->send(recipient, payload, m_channel);
			if (ec) return ec;
		}
		catch (std::exception const& e)
		{
			debug_log(recipient, "transport threw: %s", e.what());
			return errors::send_failed;
		}
		return {};
	}

	void sender::debug_log(std::string const& id, char const* fmt, ...) const
	{
		if (!m_alerts.should_post<transfer_log_alert>()) return;

		va_list v;
		va_start(v, fmt);
		m_alerts.emplace_alert<transfer_log_alert>(id, fmt, v);
		va_end(v);
	}
}
