/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/piece_codec.hpp"
#include "meshxfer/settings_pack.hpp"
#include "meshxfer/assert.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>

namespace meshxfer {

	file_source::file_source(std::string const& path, error_code& ec)
		: m_file(std::fopen(path.c_str(), "rb"))
	{
		if (!m_file)
		{
			ec.assign(errno, generic_category());
			return;
		}

		struct stat st;
		if (::fstat(fileno(m_file.get()), &st) != 0)
		{
			ec.assign(errno, generic_category());
			m_file.reset();
			return;
		}
		if (!S_ISREG(st.st_mode))
		{
			ec = errors::file_unreadable;
			m_file.reset();
			return;
		}
		m_size = std::int64_t(st.st_size);
	}

	std::size_t file_source::read(char* buf, std::size_t const len, error_code& ec)
	{
		if (!m_file) return 0;
		std::size_t const ret = std::fread(buf, 1, len, m_file.get());
		if (ret < len && std::ferror(m_file.get()))
			ec = errors::file_unreadable;
		return ret;
	}

	memory_source::memory_source(std::vector<char> buf)
		: m_buf(std::move(buf))
	{}

	std::size_t memory_source::read(char* buf, std::size_t const len, error_code&)
	{
		std::size_t const n = std::min(len, m_buf.size() - m_cursor);
		if (n > 0) std::memcpy(buf, m_buf.data() + m_cursor, n);
		m_cursor += n;
		return n;
	}

	std::uint32_t calc_num_pieces(std::int64_t const total_size
		, std::int64_t const piece_size)
	{
		if (total_size <= 0 || piece_size <= 0) return 0;
		return std::uint32_t((total_size + piece_size - 1) / piece_size);
	}

	int clamp_piece_size(int configured, std::int64_t const total_size
		, settings_pack const& s)
	{
		int const min_size = s.get_int(settings_pack::min_piece_size);
		int const max_size = s.get_int(settings_pack::max_piece_size);
		configured = std::max(configured, min_size);
		configured = std::min(configured, max_size);
		if (total_size > 0 && configured > total_size)
			configured = int(total_size);
		return configured;
	}

	std::vector<piece> split_pieces(byte_source& src, int const piece_size
		, error_code& ec)
	{
		std::vector<piece> ret;
		if (piece_size <= 0)
		{
			ec = errors::invalid_piece_size;
			return ret;
		}

		std::int64_t const total = src.size();
		ret.reserve(calc_num_pieces(total, piece_size));

		std::vector<char> buf(static_cast<std::size_t>(piece_size));
		for (;;)
		{
			// fill a whole piece, the source may return short reads
			std::size_t filled = 0;
			while (filled < buf.size())
			{
				std::size_t const n = src.read(buf.data() + filled, buf.size() - filled, ec);
				if (ec) return {};
				if (n == 0) break;
				filled += n;
			}
			if (filled == 0) break;

			piece p;
			p.index = std::uint32_t(ret.size());
			p.bytes.assign(buf.begin(), buf.begin() + std::ptrdiff_t(filled));
			ret.push_back(std::move(p));
			if (filled < buf.size()) break;
		}
		return ret;
	}

	std::vector<char> assemble_pieces(
		std::map<std::uint32_t, std::vector<char>> const& pieces
		, std::uint32_t const num_pieces, std::int64_t const expected_total_size
		, error_code& ec)
	{
		std::vector<char> ret;
		if (expected_total_size > 0)
			ret.reserve(std::size_t(expected_total_size));

		for (std::uint32_t i = 0; i < num_pieces; ++i)
		{
			auto const it = pieces.find(i);
			if (it == pieces.end())
			{
				ec = errors::missing_piece;
				return {};
			}
			ret.insert(ret.end(), it->second.begin(), it->second.end());
		}

		if (std::int64_t(ret.size()) != expected_total_size)
		{
			ec = errors::size_mismatch;
			return {};
		}
		return ret;
	}
}
