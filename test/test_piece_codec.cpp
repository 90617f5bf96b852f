/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"
#include "meshxfer/piece_codec.hpp"
#include "meshxfer/settings_pack.hpp"

#include <algorithm>
#include <cstdio>

using namespace meshxfer;

namespace {

std::map<std::uint32_t, std::vector<char>> to_map(std::vector<piece> const& pieces)
{
	std::map<std::uint32_t, std::vector<char>> ret;
	for (auto const& p : pieces) ret[p.index] = p.bytes;
	return ret;
}

// returns a source that hands out at most 7 bytes per read
struct trickle_source final : byte_source
{
	explicit trickle_source(std::vector<char> b) : buf(std::move(b)) {}
	std::int64_t size() const override { return std::int64_t(buf.size()); }
	std::size_t read(char* out, std::size_t len, error_code&) override
	{
		std::size_t const n = std::min({len, std::size_t(7), buf.size() - pos});
		std::copy(buf.begin() + std::ptrdiff_t(pos)
			, buf.begin() + std::ptrdiff_t(pos + n), out);
		pos += n;
		return n;
	}
	std::vector<char> buf;
	std::size_t pos = 0;
};

struct broken_source final : byte_source
{
	std::int64_t size() const override { return 100; }
	std::size_t read(char*, std::size_t, error_code& ec) override
	{
		ec = errors::file_unreadable;
		return 0;
	}
};

}

MESHXFER_TEST(calc_num_pieces)
{
	TEST_EQUAL(calc_num_pieces(0, 1024), 0);
	TEST_EQUAL(calc_num_pieces(1, 1024), 1);
	TEST_EQUAL(calc_num_pieces(1024, 1024), 1);
	TEST_EQUAL(calc_num_pieces(1025, 1024), 2);
	TEST_EQUAL(calc_num_pieces(2500, 1024), 3);
	TEST_EQUAL(calc_num_pieces(100, 0), 0);
}

MESHXFER_TEST(clamp_piece_size)
{
	settings_pack s;
	TEST_EQUAL(clamp_piece_size(1024, 10000, s), 1024);
	TEST_EQUAL(clamp_piece_size(10, 10000, s), 64);
	TEST_EQUAL(clamp_piece_size(4 * 1024 * 1024, 100 * 1024 * 1024, s), 1024 * 1024);
	// a small file is sent as a single piece
	TEST_EQUAL(clamp_piece_size(1024, 10, s), 10);
	// an empty file keeps the configured size
	TEST_EQUAL(clamp_piece_size(1024, 0, s), 1024);
}

MESHXFER_TEST(split_pieces)
{
	std::vector<char> const content = test_utils::make_content(2500);
	memory_source src(content);
	error_code ec;
	std::vector<piece> const pieces = split_pieces(src, 1024, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(pieces.size(), 3);
	TEST_EQUAL(pieces[0].bytes.size(), 1024);
	TEST_EQUAL(pieces[1].bytes.size(), 1024);
	TEST_EQUAL(pieces[2].bytes.size(), 452);
	for (std::uint32_t i = 0; i < 3; ++i)
	{
		TEST_EQUAL(pieces[i].index, i);
		TEST_CHECK(std::equal(pieces[i].bytes.begin(), pieces[i].bytes.end()
			, content.begin() + std::ptrdiff_t(i * 1024)));
	}
}

MESHXFER_TEST(split_pieces_exact_multiple)
{
	memory_source src(test_utils::make_content(2048));
	error_code ec;
	auto const pieces = split_pieces(src, 1024, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(pieces.size(), 2);
	TEST_EQUAL(pieces[1].bytes.size(), 1024);
}

MESHXFER_TEST(split_pieces_empty)
{
	memory_source src(std::vector<char>{});
	error_code ec;
	auto const pieces = split_pieces(src, 1024, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(pieces.empty());
}

MESHXFER_TEST(split_pieces_short_reads)
{
	std::vector<char> const content = test_utils::make_content(300);
	trickle_source src(content);
	error_code ec;
	auto const pieces = split_pieces(src, 64, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(pieces.size(), 5);
	TEST_EQUAL(pieces[4].bytes.size(), 44);

	auto const out = assemble_pieces(to_map(pieces), 5, 300, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(out == content);
}

MESHXFER_TEST(split_pieces_invalid_size)
{
	memory_source src(test_utils::make_content(10));
	error_code ec;
	auto const pieces = split_pieces(src, 0, ec);
	TEST_EQUAL(ec, error_code(errors::invalid_piece_size));
	TEST_CHECK(pieces.empty());
}

MESHXFER_TEST(split_pieces_read_error)
{
	broken_source src;
	error_code ec;
	auto const pieces = split_pieces(src, 64, ec);
	TEST_EQUAL(ec, error_code(errors::file_unreadable));
	TEST_CHECK(pieces.empty());
}

MESHXFER_TEST(assemble_pieces)
{
	std::vector<char> const content = test_utils::make_content(2500);
	memory_source src(content);
	error_code ec;
	auto const pieces = split_pieces(src, 1024, ec);
	TEST_CHECK(!ec);

	auto const out = assemble_pieces(to_map(pieces), 3, 2500, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(out == content);
}

MESHXFER_TEST(assemble_pieces_missing)
{
	memory_source src(test_utils::make_content(2500));
	error_code ec;
	auto m = to_map(split_pieces(src, 1024, ec));
	m.erase(1);
	auto const out = assemble_pieces(m, 3, 2500, ec);
	TEST_EQUAL(ec, error_code(errors::missing_piece));
	TEST_CHECK(out.empty());
}

MESHXFER_TEST(assemble_pieces_size_mismatch)
{
	memory_source src(test_utils::make_content(2500));
	error_code ec;
	auto const m = to_map(split_pieces(src, 1024, ec));
	auto const out = assemble_pieces(m, 3, 2501, ec);
	TEST_EQUAL(ec, error_code(errors::size_mismatch));
	TEST_CHECK(out.empty());
}

MESHXFER_TEST(assemble_pieces_empty)
{
	error_code ec;
	auto const out = assemble_pieces({}, 0, 0, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(out.empty());
}

MESHXFER_TEST(file_source)
{
	std::vector<char> const content = test_utils::make_content(3000);
	{
		FILE* f = std::fopen("source_file", "wb");
		TEST_CHECK(f != nullptr);
		if (f == nullptr) return;
		TEST_EQUAL(std::fwrite(content.data(), 1, content.size(), f), content.size());
		std::fclose(f);
	}

	error_code ec;
	meshxfer::file_source src("source_file", ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(src.size(), 3000);

	auto const pieces = split_pieces(src, 1024, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(pieces.size(), 3);
	auto const out = assemble_pieces(to_map(pieces), 3, 3000, ec);
	TEST_CHECK(out == content);
}

MESHXFER_TEST(file_source_missing)
{
	error_code ec;
	meshxfer::file_source src("does_not_exist", ec);
	TEST_CHECK(ec);
	TEST_EQUAL(src.size(), 0);
}

MESHXFER_TEST(file_source_directory)
{
	error_code ec;
	meshxfer::file_source src(".", ec);
	TEST_CHECK(ec);
}
