/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "meshxfer/hasher.hpp"
#include "meshxfer/messages.hpp"


using namespace meshxfer;

namespace {

template <typename T>
T round_trip(T const& m)
{
	std::vector<char> const buf = encode_message(m);
	error_code ec;
	auto const ret = decode_message(buf, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(ret);
	if (!ret) return T{};
	TEST_CHECK(std::holds_alternative<T>(*ret));
	if (!std::holds_alternative<T>(*ret)) return T{};
	return std::get<T>(*ret);
}

}

MESHXFER_TEST(file_start_merkle)
{
	file_start fs;
	fs.filename = "report.pdf";
	fs.total_size = 2500;
	fs.piece_size = 1024;
	fs.merkle_root = hash_hex("root", 4);

	file_start const out = round_trip(fs);
	TEST_EQUAL(out.filename, "report.pdf");
	TEST_EQUAL(out.total_size, 2500);
	TEST_EQUAL(out.piece_size, 1024);
	TEST_CHECK(out.merkle_root);
	TEST_EQUAL(out.merkle_root.value_or(""), *fs.merkle_root);
	TEST_CHECK(out.piece_hashes.empty());
}

MESHXFER_TEST(file_start_piece_hashes)
{
	file_start fs;
	fs.filename = "notes.txt";
	fs.total_size = 3000;
	fs.piece_size = 1024;
	fs.piece_hashes = { hash_hex("a", 1), hash_hex("b", 1), hash_hex("c", 1) };

	file_start const out = round_trip(fs);
	TEST_CHECK(!out.merkle_root);
	TEST_CHECK(out.piece_hashes == fs.piece_hashes);
}

MESHXFER_TEST(file_start_large_file)
{
	file_start fs;
	fs.filename = "big.bin";
	fs.total_size = std::int64_t(10) * 1024 * 1024 * 1024;
	fs.piece_size = 1024 * 1024;
	TEST_EQUAL(round_trip(fs).total_size, fs.total_size);
}

MESHXFER_TEST(piece_data)
{
	piece_data pd;
	pd.piece_index = 7;
	pd.data = {'a', 'b', '\0', 'c'};
	piece_data const out = round_trip(pd);
	TEST_EQUAL(out.piece_index, 7);
	TEST_CHECK(out.data == pd.data);

	// a piece may be empty
	pd.data.clear();
	TEST_CHECK(round_trip(pd).data.empty());
}

MESHXFER_TEST(resume_request)
{
	resume_request rr;
	rr.missing_indices = {1, 5, 9};
	rr.acknowledged_indices = {0, 2, 3, 4};
	resume_request const out = round_trip(rr);
	TEST_CHECK(out.missing_indices == rr.missing_indices);
	TEST_CHECK(out.acknowledged_indices == rr.acknowledged_indices);

	TEST_CHECK(round_trip(resume_request{}).missing_indices.empty());
}

MESHXFER_TEST(acknowledgement)
{
	TEST_EQUAL(round_trip(acknowledgement{42}).piece_index, 42);
}

MESHXFER_TEST(file_start_many_piece_hashes)
{
	// more hashes than any 16 bit count could carry
	file_start fs;
	fs.filename = "big.bin";
	fs.total_size = 70000 * 64;
	fs.piece_size = 64;
	for (int i = 0; i < 70000; ++i)
		fs.piece_hashes.push_back(hash_hex(reinterpret_cast<char const*>(&i), sizeof(i)));

	file_start const out = round_trip(fs);
	TEST_EQUAL(out.piece_hashes.size(), 70000);
	TEST_CHECK(out.piece_hashes == fs.piece_hashes);
}

MESHXFER_TEST(file_start_long_filename)
{
	file_start fs;
	fs.filename = std::string(70000, 'n') + ".txt";
	fs.total_size = 10;
	fs.piece_size = 10;
	TEST_EQUAL(round_trip(fs).filename, fs.filename);
}

MESHXFER_TEST(file_start_largest_size)
{
	file_start fs;
	fs.filename = "big.bin";
	fs.total_size = max_announced_size;
	fs.piece_size = 1024 * 1024;
	TEST_EQUAL(round_trip(fs).total_size, max_announced_size);
}

MESHXFER_TEST(encode_unrepresentable)
{
	file_start fs;
	fs.filename = "big.bin";
	fs.total_size = max_announced_size + 1;
	fs.piece_size = 1024 * 1024;

	error_code ec;
	TEST_CHECK(encode_message(fs, ec).empty());
	TEST_EQUAL(ec, error_code(errors::message_unrepresentable));
	TEST_THROW(encode_message(fs));

	fs.total_size = -1;
	ec.clear();
	TEST_CHECK(encode_message(fs, ec).empty());
	TEST_EQUAL(ec, error_code(errors::message_unrepresentable));

	fs.total_size = 100;
	fs.piece_size = std::int64_t(1) << 32;
	ec.clear();
	TEST_CHECK(encode_message(fs, ec).empty());
	TEST_EQUAL(ec, error_code(errors::message_unrepresentable));

	// string fields must be UTF-8
	fs.piece_size = 100;
	fs.filename = "caf\xc3\xa9.txt";
	ec.clear();
	TEST_CHECK(!encode_message(fs, ec).empty());
	TEST_CHECK(!ec);

	fs.filename = "\xff\xfe.txt";
	TEST_CHECK(encode_message(fs, ec).empty());
	TEST_EQUAL(ec, error_code(errors::message_unrepresentable));

	fs.filename = "a.txt";
	fs.piece_hashes = { hash_hex("a", 1), "\xc0\xaf" };
	ec.clear();
	TEST_CHECK(encode_message(fs, ec).empty());
	TEST_EQUAL(ec, error_code(errors::message_unrepresentable));
}

MESHXFER_TEST(envelope_field_numbers)
{
	// the oneof field number of each payload is the first byte on the wire
	TEST_EQUAL(encode_message(file_start{})[0], char(0x0a));
	TEST_EQUAL(encode_message(piece_data{})[0], char(0x12));
	TEST_EQUAL(encode_message(resume_request{})[0], char(0x1a));
	TEST_EQUAL(encode_message(acknowledgement{})[0], char(0x22));
}

MESHXFER_TEST(piece_data_layout)
{
	piece_data pd;
	pd.piece_index = 1;
	pd.data = {'x', 'y'};
	std::vector<char> const buf = encode_message(pd);
	// AkitaMessage.piece_data { piece_index: 1, data: "xy" }
	std::vector<char> const expected = {0x12, 6, 0x08, 1, 0x12, 2, 'x', 'y'};
	TEST_CHECK(buf == expected);

	error_code ec;
	auto const m = decode_message(expected, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(m && std::holds_alternative<piece_data>(*m));
}

MESHXFER_TEST(message_name)
{
	TEST_EQUAL(std::string(message_name(file_start{})), "file_start");
	TEST_EQUAL(std::string(message_name(piece_data{})), "piece_data");
	TEST_EQUAL(std::string(message_name(resume_request{})), "resume_request");
	TEST_EQUAL(std::string(message_name(acknowledgement{})), "acknowledgement");
}

MESHXFER_TEST(decode_empty)
{
	error_code ec;
	TEST_CHECK(!decode_message(std::vector<char>(), ec));
	TEST_EQUAL(ec, error_code(errors::message_truncated));
}

MESHXFER_TEST(decode_garbage)
{
	error_code ec;
	TEST_CHECK(!decode_message(std::vector<char>{char(0x7f), 1, 2}, ec));
	TEST_EQUAL(ec, error_code(errors::invalid_message));
}

MESHXFER_TEST(decode_no_payload)
{
	// a well formed envelope holding only an unknown field
	error_code ec;
	TEST_CHECK(!decode_message(std::vector<char>{0x28, 1}, ec));
	TEST_EQUAL(ec, error_code(errors::invalid_message));
}

MESHXFER_TEST(decode_truncated)
{
	file_start fs;
	fs.filename = "report.pdf";
	fs.total_size = 2500;
	fs.piece_size = 1024;
	fs.piece_hashes = { hash_hex("a", 1), hash_hex("b", 1), hash_hex("c", 1) };
	std::vector<char> const full = encode_message(fs);

	// every strict prefix of the message is rejected
	for (std::size_t len = 1; len < full.size(); ++len)
	{
		error_code ec;
		TEST_CHECK(!decode_message(full.data(), len, ec));
		TEST_EQUAL(ec, error_code(errors::invalid_message));
	}

	resume_request rr;
	rr.missing_indices = {1, 2, 3};
	std::vector<char> buf = encode_message(rr);
	buf.resize(buf.size() - 2);
	error_code ec;
	TEST_CHECK(!decode_message(buf, ec));
	TEST_EQUAL(ec, error_code(errors::invalid_message));
}
