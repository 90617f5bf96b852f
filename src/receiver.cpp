/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/receiver.hpp"
#include "meshxfer/alert_manager.hpp"
#include "meshxfer/alert_types.hpp"
#include "meshxfer/aux_/throw.hpp"
#include "meshxfer/hasher.hpp"
#include "meshxfer/hex.hpp"
#include "meshxfer/merkle.hpp"
#include "meshxfer/piece_codec.hpp"
#include "meshxfer/sha256_hash.hpp"
#include "meshxfer/transport.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdarg>
#include <exception>
#include <map>
#include <utility>

namespace meshxfer {

namespace aux {

	struct receiver_transfer
	{
		file_start expected;
		std::uint32_t num_pieces = 0;

		std::map<std::uint32_t, std::vector<char>> received;
		std::map<std::uint32_t, std::string> received_hashes;

		// bit i is set while piece i is held in received. Clear bits are the
		// missing pieces
		std::vector<bool> have;
		std::uint32_t num_have = 0;

		// pieces asked for in the last resume request and not received since
		std::vector<bool> requested;

		// the number of resume requests each index was part of, since it
		// was last received
		std::map<std::uint32_t, int> retry_count;

		// the number of times each index arrived with the wrong hash. This
		// is not reset when the piece arrives again
		std::map<std::uint32_t, int> hash_failures;

		bool complete = false;
		bool failed = false;
		bool is_broadcast = false;
		std::string origin;

		time_point start_time;
		time_point last_activity;
		time_point last_request;

		int merkle_failures = 0;
		std::uint64_t generation = 0;

		bool releasable() const { return complete || failed; }

		void init_bitmaps()
		{
			have.assign(num_pieces, false);
			requested.assign(num_pieces, false);
			num_have = 0;
		}

		void set_have(std::uint32_t const i)
		{
			if (!have[i]) ++num_have;
			have[i] = true;
			requested[i] = false;
		}

		void clear_have(std::uint32_t const i)
		{
			if (have[i]) --num_have;
			have[i] = false;
		}
	};
}

namespace {

	std::vector<std::uint32_t> to_vector(std::set<std::uint32_t> const& s)
	{
		return std::vector<std::uint32_t>(s.begin(), s.end());
	}

	std::vector<std::uint32_t> set_bits(std::vector<bool> const& bits, bool const value)
	{
		std::vector<std::uint32_t> ret;
		for (std::uint32_t i = 0; i < bits.size(); ++i)
			if (bits[i] == value) ret.push_back(i);
		return ret;
	}
}

	receiver::receiver(std::shared_ptr<transport_interface> transport
		, std::shared_ptr<storage_interface> storage
		, alert_manager& alerts
		, settings_pack const& s)
		: m_transport(std::move(transport))
		, m_storage(std::move(storage))
		, m_alerts(alerts)
		, m_settings(s)
		, m_retry(s)
		, m_request_interval(s.get_int(settings_pack::resume_request_interval))
		, m_inactivity_timeout(s.get_int(settings_pack::inactivity_timeout))
		, m_channel(s.get_int(settings_pack::transport_channel))
	{
		if (!m_transport || !m_storage)
			aux::throw_ex<system_error>(error_code(errors::missing_capability));
	}

	receiver::~receiver() = default;

	std::string receiver::transfer_id(std::string const& origin, bool const is_broadcast)
	{
		return is_broadcast ? "broadcast_" + origin : origin;
	}

	void receiver::handle_file_start(std::string const& origin, file_start const& fs
		, bool const is_broadcast)
	{
		std::string const id = transfer_id(origin, is_broadcast);
		if (m_transfers.remove(id))
			debug_log(id, "duplicate file start, dropping the previous transfer");

		auto reject = [&](error_code const& ec)
		{
			debug_log(id, "rejecting \"%s\": %s", fs.filename.c_str()
				, ec.message().c_str());
			if (m_alerts.should_post<transfer_failed_alert>())
				m_alerts.emplace_alert<transfer_failed_alert>(id, fs.filename, ec);
		};

		std::int64_t const total_size = fs.total_size;
		std::int64_t piece_size = fs.piece_size;
		std::int64_t const min_size = m_settings.get_int(settings_pack::min_piece_size);
		std::int64_t const max_size = m_settings.get_int(settings_pack::max_piece_size);

		if (total_size < 0 || piece_size < 0 || (piece_size == 0 && total_size > 0))
		{
			reject(errors::invalid_piece_size);
			return;
		}

		if (total_size > 0 && piece_size > total_size)
		{
			debug_log(id, "piece size %" PRId64 " larger than the file, using %" PRId64
				, piece_size, total_size);
			piece_size = total_size;
		}

		// a single piece covering a small file may be below the minimum
		if (total_size > 0 && (piece_size > max_size
			|| (piece_size < min_size && piece_size < total_size)))
		{
			reject(errors::invalid_piece_size);
			return;
		}

		if (total_size > max_file_size(m_settings))
		{
			reject(errors::file_too_large);
			return;
		}

		auto t = std::make_unique<aux::receiver_transfer>();
		t->expected = fs;
		t->expected.piece_size = piece_size;

		error_code ec;
		if (t->expected.merkle_root)
		{
			sha256_from_hex(*t->expected.merkle_root, ec);
			if (ec)
			{
				reject(ec);
				return;
			}
			t->expected.merkle_root = aux::to_lower_hex(*t->expected.merkle_root);
		}
		for (auto& h : t->expected.piece_hashes)
		{
			sha256_from_hex(h, ec);
			if (ec)
			{
				reject(ec);
				return;
			}
			h = aux::to_lower_hex(h);
		}

		std::uint32_t const num_pieces = calc_num_pieces(total_size, piece_size);
		t->num_pieces = num_pieces;

		if (t->expected.merkle_root)
		{
			debug_log(id, "verifying \"%s\" against Merkle root %s", fs.filename.c_str()
				, t->expected.merkle_root->c_str());
		}
		else if (!t->expected.piece_hashes.empty())
		{
			if (t->expected.piece_hashes.size() != num_pieces)
				debug_log(id, "%d piece hashes for %u pieces, verification will be partial"
					, int(t->expected.piece_hashes.size()), num_pieces);
		}
		else if (total_size > 0)
		{
			debug_log(id, "no integrity information for \"%s\"", fs.filename.c_str());
		}

		if (m_alerts.should_post<file_start_alert>())
			m_alerts.emplace_alert<file_start_alert>(id, fs.filename, total_size
				, num_pieces, is_broadcast);

		time_point const now = aux::time_now();
		if (num_pieces == 0)
		{
			debug_log(id, "\"%s\" is empty, saving", fs.filename.c_str());
			save_file(id, fs.filename, std::vector<char>(), now);
			return;
		}

		t->init_bitmaps();
		t->is_broadcast = is_broadcast;
		t->origin = origin;
		t->start_time = now;
		t->last_activity = now;
		t->last_request = now;
		t->generation = ++m_next_generation;

		debug_log(id, "receiving \"%s\" (%" PRId64 " bytes, %u pieces)"
			, fs.filename.c_str(), total_size, num_pieces);
		m_transfers.insert(id, std::move(t));
	}

	void receiver::handle_piece_data(std::string const& origin, piece_data const& pd
		, bool const is_broadcast)
	{
		std::string const id = transfer_id(origin, is_broadcast);
		std::uint32_t const index = pd.piece_index;

		enum class outcome { stored, out_of_range, duplicate, terminal };

		std::string const hash = hash_hex(pd.data);
		std::uint32_t num_pieces = 0;
		auto const ret = m_transfers.with_transfer(id, [&](aux::receiver_transfer& t)
		{
			if (t.complete || t.failed) return outcome::terminal;
			num_pieces = t.num_pieces;
			if (index >= t.num_pieces) return outcome::out_of_range;
			if (t.have[index]) return outcome::duplicate;

			t.received[index] = pd.data;
			t.received_hashes[index] = hash;
			t.set_have(index);
			t.retry_count.erase(index);
			t.last_activity = aux::time_now();
			return outcome::stored;
		});

		if (!ret)
		{
			debug_log(id, "piece %u for unknown transfer", index);
			return;
		}

		switch (*ret)
		{
			case outcome::terminal:
			case outcome::duplicate:
				return;
			case outcome::out_of_range:
				debug_log(id, "piece index %u out of range (%u pieces)", index, num_pieces);
				return;
			case outcome::stored:
				break;
		}

		check_and_assemble(id);
	}

	void receiver::check_and_assemble(std::string const& id)
	{
		enum class outcome { incomplete, request, fail, save };

		std::set<std::uint32_t> request;
		bool merkle_mismatch = false;
		std::optional<std::uint32_t> hash_exhausted;
		error_code fail_ec;
		std::string filename;
		std::vector<char> data;
		time_point start_time;
		std::string origin;
		bool is_broadcast = false;
		std::uint32_t num_pieces = 0;

		auto const ret = m_transfers.with_transfer(id, [&](aux::receiver_transfer& t)
		{
			if (t.complete || t.failed) return outcome::incomplete;
			if (t.num_have != t.num_pieces) return outcome::incomplete;

			filename = t.expected.filename;
			start_time = t.start_time;
			origin = t.origin;
			is_broadcast = t.is_broadcast;
			num_pieces = t.num_pieces;

			if (t.expected.merkle_root)
			{
				std::vector<std::string> leaves;
				leaves.reserve(t.num_pieces);
				for (auto const& h : t.received_hashes) leaves.push_back(h.second);
				auto const root = merkle_root(leaves);
				if (!root || *root != *t.expected.merkle_root)
				{
					merkle_mismatch = true;
					++t.merkle_failures;
					t.received.clear();
					t.received_hashes.clear();
					t.retry_count.clear();
					t.init_bitmaps();

					if (m_retry.exhausted(t.merkle_failures))
					{
						t.failed = true;
						fail_ec = errors::integrity_check_failed;
						return outcome::fail;
					}
					for (std::uint32_t i = 0; i < t.num_pieces; ++i)
						request.insert(request.end(), i);
					return outcome::request;
				}
			}
			else if (!t.expected.piece_hashes.empty())
			{
				std::uint32_t const check_up_to = std::min(t.num_pieces
					, std::uint32_t(t.expected.piece_hashes.size()));
				for (std::uint32_t i = 0; i < check_up_to; ++i)
				{
					auto const h = t.received_hashes.find(i);
					if (h == t.received_hashes.end() || h->second != t.expected.piece_hashes[i])
						request.insert(i);
				}
				if (!request.empty())
				{
					for (auto const i : request)
					{
						t.received.erase(i);
						t.received_hashes.erase(i);
						t.clear_have(i);
						if (m_retry.exhausted(++t.hash_failures[i]))
							hash_exhausted = i;
					}
					if (hash_exhausted)
					{
						t.failed = true;
						fail_ec = errors::integrity_check_failed;
						return outcome::fail;
					}
					return outcome::request;
				}
			}

			error_code ec;
			data = assemble_pieces(t.received, t.num_pieces, t.expected.total_size, ec);
			if (ec)
			{
				t.failed = true;
				fail_ec = ec;
				return outcome::fail;
			}
			t.complete = true;
			return outcome::save;
		});

		if (!ret) return;

		switch (*ret)
		{
			case outcome::incomplete:
				return;
			case outcome::request:
				debug_log(id, "%s, requesting %d pieces again"
					, merkle_mismatch ? "Merkle root mismatch" : "piece hash mismatch"
					, int(request.size()));
				if (m_alerts.should_post<hash_failed_alert>())
					m_alerts.emplace_alert<hash_failed_alert>(id, to_vector(request)
						, merkle_mismatch);
				send_resume_request(id, request);
				return;
			case outcome::fail:
				if (merkle_mismatch && m_alerts.should_post<hash_failed_alert>())
					m_alerts.emplace_alert<hash_failed_alert>(id
						, std::vector<std::uint32_t>(), true);
				if (hash_exhausted)
				{
					debug_log(id, "piece %u failed the hash check %d times"
						, *hash_exhausted, m_retry.max_retries);
					if (m_alerts.should_post<hash_failed_alert>())
						m_alerts.emplace_alert<hash_failed_alert>(id, to_vector(request)
							, false);
				}
				fail_transfer(id, filename, fail_ec);
				return;
			case outcome::save:
				break;
		}

		if (!save_file(id, filename, data, start_time) || is_broadcast) return;
		send_completion(id, origin, num_pieces);
	}

	void receiver::send_completion(std::string const& id, std::string const& origin
		, std::uint32_t const num_pieces)
	{
		resume_request req;
		req.acknowledged_indices.resize(num_pieces);
		for (std::uint32_t i = 0; i < num_pieces; ++i)
			req.acknowledged_indices[i] = i;

		error_code ec;
		try
		{
			ec = m_transport->send(origin, encode_message(req), m_channel);
		}
		catch (std::exception const& e)
		{
			debug_log(id, "transport threw: %s", e.what());
			ec = errors::send_failed;
		}

		if (ec)
		{
			debug_log(id, "failed to acknowledge the completed file: %s"
				, ec.message().c_str());
			return;
		}

		if (m_alerts.should_post<resume_request_alert>())
			m_alerts.emplace_alert<resume_request_alert>(id, 0, int(num_pieces), false);
	}

	std::set<std::uint32_t> receiver::check_for_missing_or_corrupt(std::string const& id)
	{
		std::set<std::uint32_t> needed;
		std::vector<std::uint32_t> exhausted;
		std::string filename;

		m_transfers.with_transfer(id, [&](aux::receiver_transfer& t)
		{
			if (t.complete || t.failed) return;
			filename = t.expected.filename;

			for (std::uint32_t i = 0; i < t.num_pieces; ++i)
			{
				if (t.have[i]) continue;
				auto const r = t.retry_count.find(i);
				if (r != t.retry_count.end() && m_retry.exhausted(r->second))
					exhausted.push_back(i);
				else
					needed.insert(needed.end(), i);
			}
			if (!exhausted.empty()) t.failed = true;
		});

		if (exhausted.empty()) return needed;

		debug_log(id, "piece %u requested %d times without arriving"
			, exhausted.front(), m_retry.max_retries);
		fail_transfer(id, filename, errors::retries_exhausted);
		return {};
	}

	error_code receiver::send_resume_request(std::string const& id
		, std::set<std::uint32_t> const& missing)
	{
		if (missing.empty()) return {};

		resume_request req;
		std::string origin;
		std::uint64_t generation = 0;
		bool const suppressed = !m_transfers.with_transfer(id
			, [&](aux::receiver_transfer const& t)
		{
			if (t.is_broadcast || t.complete || t.failed) return false;
			origin = t.origin;
			generation = t.generation;
			req.missing_indices = to_vector(missing);
			req.acknowledged_indices.reserve(t.received.size());
			for (auto const& p : t.received)
				req.acknowledged_indices.push_back(p.first);
			return true;
		}).value_or(false);
		if (suppressed) return {};

		std::vector<char> const payload = encode_message(req);
		error_code ec;
		try
		{
			ec = m_transport->send(origin, payload, m_channel);
		}
		catch (std::exception const& e)
		{
			debug_log(id, "transport threw: %s", e.what());
			ec = errors::send_failed;
		}

		if (ec)
		{
			// the indices are left as they were, the next tick tries again
			debug_log(id, "failed to send resume request: %s", ec.message().c_str());
			return ec;
		}

		time_point const now = aux::time_now();
		m_transfers.with_transfer(id, [&](aux::receiver_transfer& t)
		{
			if (t.generation != generation) return;
			for (auto const i : missing)
			{
				if (i >= t.num_pieces || t.have[i]) continue;
				t.requested[i] = true;
				++t.retry_count[i];
			}
			t.last_request = now;
		});

		debug_log(id, "requested %d pieces, acknowledged %d"
			, int(req.missing_indices.size()), int(req.acknowledged_indices.size()));
		if (m_alerts.should_post<resume_request_alert>())
			m_alerts.emplace_alert<resume_request_alert>(id
				, int(req.missing_indices.size())
				, int(req.acknowledged_indices.size()), false);
		return {};
	}

	void receiver::tick(time_point const now)
	{
		std::vector<std::pair<std::string, std::string>> timed_out;
		std::vector<std::string> due;

		m_transfers.for_each([&](std::string const& id, aux::receiver_transfer& t)
		{
			if (t.complete || t.failed) return;
			if (now - t.last_activity > m_inactivity_timeout)
			{
				t.failed = true;
				timed_out.emplace_back(id, t.expected.filename);
				return;
			}
			if (t.is_broadcast) return;
			if (now - t.last_request >= m_request_interval)
				due.push_back(id);
		});

		for (auto const& e : timed_out)
		{
			debug_log(e.first, "no activity for %d seconds"
				, int(m_inactivity_timeout.count()));
			fail_transfer(e.first, e.second, errors::timed_out_inactivity);
		}

		for (auto const& id : due)
		{
			std::set<std::uint32_t> const needed = check_for_missing_or_corrupt(id);
			if (needed.empty())
			{
				m_transfers.with_transfer(id, [&](aux::receiver_transfer& t)
				{ t.last_request = now; });
				continue;
			}

			// the request clock is only reset by a successful send, so a
			// failed request goes out again on the next tick
			error_code const ec = send_resume_request(id, needed);
			if (ec) debug_log(id, "retrying resume request on the next tick");
		}
	}

	error_code receiver::incoming_packet(std::string const& origin
		, std::vector<char> const& payload, bool const is_broadcast)
	{
		error_code ec;
		auto const m = decode_message(payload, ec);
		if (!m)
		{
			debug_log(transfer_id(origin, is_broadcast)
				, "dropping undecodable packet: %s", ec.message().c_str());
			return ec;
		}

		if (auto const* fs = std::get_if<file_start>(&*m))
			handle_file_start(origin, *fs, is_broadcast);
		else if (auto const* pd = std::get_if<piece_data>(&*m))
			handle_piece_data(origin, *pd, is_broadcast);
		else
			debug_log(transfer_id(origin, is_broadcast), "ignoring %s message"
				, message_name(*m));
		return ec;
	}

	std::optional<receiver_status> receiver::status(std::string const& id) const
	{
		return m_transfers.with_transfer(id, [](aux::receiver_transfer const& t)
		{
			receiver_status st;
			st.filename = t.expected.filename;
			st.origin = t.origin;
			st.total_size = t.expected.total_size;
			st.piece_size = t.expected.piece_size;
			st.num_pieces = t.num_pieces;
			st.num_received = t.num_have;
			st.missing = set_bits(t.have, false);
			st.requested = set_bits(t.requested, true);
			st.is_broadcast = t.is_broadcast;
			st.merkle_failures = t.merkle_failures;
			for (auto const& f : t.hash_failures) st.hash_failures += f.second;
			return st;
		});
	}

	int receiver::num_transfers() const
	{
		return m_transfers.size();
	}

	void receiver::fail_transfer(std::string const& id, std::string const& filename
		, error_code const& ec)
	{
		debug_log(id, "transfer of \"%s\" failed: %s", filename.c_str()
			, ec.message().c_str());
		if (m_alerts.should_post<transfer_failed_alert>())
			m_alerts.emplace_alert<transfer_failed_alert>(id, filename, ec);
	}

	bool receiver::save_file(std::string const& id, std::string const& filename
		, std::vector<char> const& data, time_point const start_time)
	{
		error_code ec;
		try
		{
			ec = m_storage->save(filename, data);
		}
		catch (std::exception const& e)
		{
			debug_log(id, "storage threw: %s", e.what());
			ec = errors::save_failed;
		}

		if (ec)
		{
			debug_log(id, "failed to save \"%s\": %s", filename.c_str()
				, ec.message().c_str());
			fail_transfer(id, filename, errors::save_failed);
			return false;
		}

		debug_log(id, "saved \"%s\" (%d bytes)", filename.c_str(), int(data.size()));
		if (m_alerts.should_post<file_saved_alert>())
			m_alerts.emplace_alert<file_saved_alert>(id, filename
				, std::int64_t(data.size()), aux::time_now() - start_time);
		return true;
	}

	void receiver::debug_log(std::string const& id, char const* fmt, ...) const
	{
		if (!m_alerts.should_post<transfer_log_alert>()) return;

		va_list v;
		va_start(v, fmt);
		m_alerts.emplace_alert<transfer_log_alert>(id, fmt, v);
		va_end(v);
	}
}
