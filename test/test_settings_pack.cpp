/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "meshxfer/settings_pack.hpp"
#include "meshxfer/load_config.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

using namespace meshxfer;

namespace {

void write_file(char const* name, char const* content)
{
	FILE* f = std::fopen(name, "w");
	TEST_CHECK(f != nullptr);
	if (f == nullptr) return;
	std::fputs(content, f);
	std::fclose(f);
}

}

MESHXFER_TEST(default_values)
{
	settings_pack const p;
	TEST_EQUAL(p.size(), 0);
	TEST_EQUAL(p.get_int(settings_pack::piece_size), 1024);
	TEST_EQUAL(p.get_int(settings_pack::min_piece_size), 64);
	TEST_EQUAL(p.get_int(settings_pack::max_piece_size), 1024 * 1024);
	TEST_EQUAL(p.get_int(settings_pack::max_retries), 3);
	TEST_EQUAL(p.get_int(settings_pack::resume_request_interval), 10);
	TEST_EQUAL(p.get_int(settings_pack::inactivity_timeout), 300);
	TEST_EQUAL(p.get_int(settings_pack::initial_send_delay), 200);
	TEST_EQUAL(p.get_int(settings_pack::min_send_delay), 50);
	TEST_EQUAL(p.get_int(settings_pack::max_send_delay), 1000);
	TEST_EQUAL(p.get_int(settings_pack::retry_threshold), 3);
	TEST_EQUAL(p.get_int(settings_pack::max_send_failures), 5);
	TEST_EQUAL(p.get_bool(settings_pack::use_merkle_root), true);
	TEST_EQUAL(max_file_size(p), std::int64_t(10) * 1024 * 1024 * 1024);
}

MESHXFER_TEST(default_settings)
{
	settings_pack const p = default_settings();
	TEST_CHECK(p.has_val(settings_pack::piece_size));
	TEST_CHECK(p.has_val(settings_pack::use_merkle_root));
	TEST_EQUAL(p.get_int(settings_pack::transport_channel), 123);
	TEST_EQUAL(p.size(), settings_pack::num_int_settings + settings_pack::num_bool_settings);
}

MESHXFER_TEST(set_and_clear)
{
	settings_pack p;
	TEST_CHECK(!p.has_val(settings_pack::max_retries));
	p.set_int(settings_pack::max_retries, 7);
	TEST_CHECK(p.has_val(settings_pack::max_retries));
	TEST_EQUAL(p.get_int(settings_pack::max_retries), 7);

	// setting again replaces the value
	p.set_int(settings_pack::max_retries, 8);
	TEST_EQUAL(p.get_int(settings_pack::max_retries), 8);
	TEST_EQUAL(p.size(), 1);

	p.set_bool(settings_pack::use_merkle_root, false);
	TEST_EQUAL(p.get_bool(settings_pack::use_merkle_root), false);
	TEST_EQUAL(p.size(), 2);

	p.clear(settings_pack::max_retries);
	TEST_CHECK(!p.has_val(settings_pack::max_retries));
	TEST_EQUAL(p.get_int(settings_pack::max_retries), 3);

	p.clear();
	TEST_EQUAL(p.size(), 0);
	TEST_EQUAL(p.get_bool(settings_pack::use_merkle_root), true);
}

MESHXFER_TEST(setting_names)
{
	TEST_EQUAL(setting_by_name("max_retries"), int(settings_pack::max_retries));
	TEST_EQUAL(setting_by_name("use_merkle_root"), int(settings_pack::use_merkle_root));
	TEST_EQUAL(setting_by_name("no_such_setting"), -1);
	TEST_EQUAL(std::string(name_for_setting(settings_pack::piece_size)), "piece_size");
	TEST_EQUAL(std::string(name_for_setting(settings_pack::inactivity_timeout)), "inactivity_timeout");

	// every setting maps back to itself
	for (int i = 0; i < settings_pack::num_int_settings; ++i)
	{
		int const s = settings_pack::int_type_base + i;
		TEST_EQUAL(setting_by_name(name_for_setting(s)), s);
	}
}

MESHXFER_TEST(load_config)
{
	write_file("test.conf",
		"# transfer tuning\n"
		"piece_size 512\n"
		"max_retries 5\n"
		"\n"
		"use_merkle_root false\n"
		"unknown_key 17\n"
		"inactivity_timeout 60\n");

	settings_pack p;
	error_code ec;
	load_config("test.conf", p, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(p.get_int(settings_pack::piece_size), 512);
	TEST_EQUAL(p.get_int(settings_pack::max_retries), 5);
	TEST_EQUAL(p.get_int(settings_pack::inactivity_timeout), 60);
	TEST_EQUAL(p.get_bool(settings_pack::use_merkle_root), false);
	TEST_EQUAL(p.size(), 4);
}

MESHXFER_TEST(load_config_numeric_bool)
{
	write_file("bool.conf", "use_merkle_root 0\n");
	settings_pack p;
	error_code ec;
	load_config("bool.conf", p, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(p.get_bool(settings_pack::use_merkle_root), false);
}

MESHXFER_TEST(load_config_missing_file)
{
	settings_pack p;
	error_code ec;
	load_config("does_not_exist.conf", p, ec);
	TEST_EQUAL(ec, error_code(ENOENT, generic_category()));
	TEST_EQUAL(p.size(), 0);
}
