/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_PIECE_CODEC_HPP_INCLUDED
#define MESHXFER_PIECE_CODEC_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/error_code.hpp"

#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace meshxfer {

	struct settings_pack;

	// a contiguous slice of a file. ``index`` is the zero based position of
	// the piece in the file. Pieces are never modified once created.
	struct MESHXFER_EXPORT piece
	{
		std::uint32_t index = 0;
		std::vector<char> bytes;
	};

	// the sequential reader split_pieces() pulls file content from. It
	// lets large files be split without reading them into memory up front.
	struct MESHXFER_EXPORT byte_source
	{
		// the total number of bytes the source will produce
		virtual std::int64_t size() const = 0;

		// reads up to ``len`` bytes into ``buf``. Returns the number of bytes
		// read, 0 at the end of the source. On failure, ``ec`` is set.
		virtual std::size_t read(char* buf, std::size_t len, error_code& ec) = 0;

		virtual ~byte_source() = default;
	};

	// reads a file from disk
	class MESHXFER_EXPORT file_source final : public byte_source
	{
	public:
		// opens ``path`` for reading. If the file can't be opened or its size
		// can't be determined, ``ec`` is set and the source is empty.
		file_source(std::string const& path, error_code& ec);

		std::int64_t size() const override { return m_size; }
		std::size_t read(char* buf, std::size_t len, error_code& ec) override;

	private:
		struct file_closer
		{
			void operator()(FILE* f) const { if (f != nullptr) std::fclose(f); }
		};

		std::unique_ptr<FILE, file_closer> m_file;
		std::int64_t m_size = 0;
	};

	// reads from a buffer held in memory
	class MESHXFER_EXPORT memory_source final : public byte_source
	{
	public:
		explicit memory_source(std::vector<char> buf);

		std::int64_t size() const override { return std::int64_t(m_buf.size()); }
		std::size_t read(char* buf, std::size_t len, error_code& ec) override;

	private:
		std::vector<char> m_buf;
		std::size_t m_cursor = 0;
	};

	// the number of pieces a file of ``total_size`` bytes is split into.
	// Only an empty file has zero pieces.
	MESHXFER_EXPORT std::uint32_t calc_num_pieces(std::int64_t total_size
		, std::int64_t piece_size);

	// clamp the configured piece size to the range allowed by the settings
	// and to the size of the file (unless the file is empty).
	MESHXFER_EXPORT int clamp_piece_size(int configured, std::int64_t total_size
		, settings_pack const& s);

	// reads the whole source and splits it into sequential, non-overlapping
	// pieces of ``piece_size`` bytes. Only the last piece may be shorter. An
	// empty source yields no pieces.
	MESHXFER_EXPORT std::vector<piece> split_pieces(byte_source& src
		, int piece_size, error_code& ec);

	// concatenate the pieces in index order. Every index in
	// ``[0, num_pieces)`` must be present (``errors::missing_piece``) and the
	// result must be exactly ``expected_total_size`` bytes
	// (``errors::size_mismatch``).
	MESHXFER_EXPORT std::vector<char> assemble_pieces(
		std::map<std::uint32_t, std::vector<char>> const& pieces
		, std::uint32_t num_pieces, std::int64_t expected_total_size
		, error_code& ec);
}

#endif // MESHXFER_PIECE_CODEC_HPP_INCLUDED
