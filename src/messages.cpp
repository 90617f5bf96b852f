/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/messages.hpp"
#include "meshxfer/aux_/throw.hpp"

#include "akita.pb.h"

#include <climits>

namespace meshxfer {

namespace {

	// proto3 parsers reject string fields that aren't UTF-8, so such a string
	// can't be sent either
	bool valid_utf8(std::string const& s)
	{
		auto const* p = reinterpret_cast<unsigned char const*>(s.data());
		auto const* const end = p + s.size();
		while (p < end)
		{
			int len;
			std::uint32_t cp;
			if (*p < 0x80) { ++p; continue; }
			else if ((*p & 0xe0) == 0xc0) { len = 1; cp = *p & 0x1f; }
			else if ((*p & 0xf0) == 0xe0) { len = 2; cp = *p & 0x0f; }
			else if ((*p & 0xf8) == 0xf0) { len = 3; cp = *p & 0x07; }
			else return false;

			if (end - p <= len) return false;
			for (int i = 1; i <= len; ++i)
			{
				if ((p[i] & 0xc0) != 0x80) return false;
				cp = (cp << 6) | (p[i] & 0x3f);
			}
			// overlong forms, surrogates and values past U+10FFFF
			static std::uint32_t const min_cp[] = {0, 0x80, 0x800, 0x10000};
			if (cp < min_cp[len] || cp > 0x10ffff
				|| (cp >= 0xd800 && cp <= 0xdfff))
				return false;
			p += len + 1;
		}
		return true;
	}

	struct encoder
	{
		akita::AkitaMessage& pb;

		bool operator()(file_start const& m) const
		{
			if (m.total_size < 0 || m.total_size > max_announced_size
				|| m.piece_size < 0 || m.piece_size > max_announced_size)
				return false;
			if (!valid_utf8(m.filename)) return false;

			auto* fs = pb.mutable_file_start();
			fs->set_filename(m.filename);
			fs->set_total_size(std::uint32_t(m.total_size));
			fs->set_piece_size(std::uint32_t(m.piece_size));
			if (m.merkle_root)
			{
				if (!valid_utf8(*m.merkle_root)) return false;
				fs->set_merkle_root(*m.merkle_root);
			}
			fs->mutable_piece_hashes()->Reserve(int(m.piece_hashes.size()));
			for (auto const& h : m.piece_hashes)
			{
				if (!valid_utf8(h)) return false;
				fs->add_piece_hashes(h);
			}
			return true;
		}

		bool operator()(piece_data const& m) const
		{
			auto* pd = pb.mutable_piece_data();
			pd->set_piece_index(m.piece_index);
			pd->set_data(m.data.data(), m.data.size());
			return true;
		}

		bool operator()(resume_request const& m) const
		{
			auto* rr = pb.mutable_resume_request();
			rr->mutable_missing_indices()->Add(m.missing_indices.begin()
				, m.missing_indices.end());
			rr->mutable_acknowledged_indices()->Add(m.acknowledged_indices.begin()
				, m.acknowledged_indices.end());
			return true;
		}

		bool operator()(acknowledgement const& m) const
		{
			pb.mutable_acknowledgement()->set_piece_index(m.piece_index);
			return true;
		}
	};

	file_start from_wire(akita::FileStart const& pb)
	{
		file_start m;
		m.filename = pb.filename();
		m.total_size = pb.total_size();
		m.piece_size = pb.piece_size();
		if (pb.has_merkle_root()) m.merkle_root = pb.merkle_root();
		m.piece_hashes.assign(pb.piece_hashes().begin(), pb.piece_hashes().end());
		return m;
	}
}

	char const* message_name(message const& m)
	{
		static char const* names[] = {
			"file_start", "piece_data", "resume_request", "acknowledgement" };
		return names[m.index()];
	}

	std::vector<char> encode_message(message const& m, error_code& ec)
	{
		akita::AkitaMessage pb;
		if (!std::visit(encoder{pb}, m))
		{
			ec = errors::message_unrepresentable;
			return {};
		}

		std::size_t const size = pb.ByteSizeLong();
		if (size > std::size_t(INT_MAX))
		{
			ec = errors::message_unrepresentable;
			return {};
		}
		std::vector<char> ret(size);
		if (!pb.SerializeToArray(ret.data(), int(size)))
		{
			ec = errors::message_unrepresentable;
			return {};
		}
		return ret;
	}

	std::vector<char> encode_message(message const& m)
	{
		error_code ec;
		std::vector<char> ret = encode_message(m, ec);
		if (ec) aux::throw_ex<system_error>(ec);
		return ret;
	}

	std::optional<message> decode_message(char const* buf, std::size_t const len
		, error_code& ec)
	{
		if (len == 0)
		{
			ec = errors::message_truncated;
			return std::nullopt;
		}

		akita::AkitaMessage pb;
		if (len > std::size_t(INT_MAX) || !pb.ParseFromArray(buf, int(len)))
		{
			ec = errors::invalid_message;
			return std::nullopt;
		}

		switch (pb.payload_case())
		{
			case akita::AkitaMessage::kFileStart:
				return message(from_wire(pb.file_start()));

			case akita::AkitaMessage::kPieceData:
			{
				auto const& pd = pb.piece_data();
				piece_data m;
				m.piece_index = pd.piece_index();
				m.data.assign(pd.data().begin(), pd.data().end());
				return message(std::move(m));
			}

			case akita::AkitaMessage::kResumeRequest:
			{
				auto const& rr = pb.resume_request();
				resume_request m;
				m.missing_indices.assign(rr.missing_indices().begin()
					, rr.missing_indices().end());
				m.acknowledged_indices.assign(rr.acknowledged_indices().begin()
					, rr.acknowledged_indices().end());
				return message(std::move(m));
			}

			case akita::AkitaMessage::kAcknowledgement:
				return message(acknowledgement{pb.acknowledgement().piece_index()});

			case akita::AkitaMessage::PAYLOAD_NOT_SET:
				break;
		}

		ec = errors::invalid_message;
		return std::nullopt;
	}

	std::optional<message> decode_message(std::vector<char> const& buf
		, error_code& ec)
	{
		return decode_message(buf.data(), buf.size(), ec);
	}
}
