/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/load_config.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

namespace meshxfer {

namespace {

	struct file_closer
	{
		void operator()(FILE* f) const { if (f != nullptr) std::fclose(f); }
	};

	bool parse_bool(char const* value)
	{
		if (std::strcmp(value, "true") == 0) return true;
		if (std::strcmp(value, "false") == 0) return false;
		return std::atoi(value) != 0;
	}
}

	void load_config(std::string const& config_file, settings_pack& p
		, error_code& ec)
	{
		std::unique_ptr<FILE, file_closer> f(std::fopen(config_file.c_str(), "r"));
		if (!f)
		{
			ec.assign(errno, generic_category());
			return;
		}

		char line[1024];
		char key[512];
		char value[512];

		while (std::fgets(line, sizeof(line), f.get()) != nullptr)
		{
			if (line[0] == '#') continue;
			if (std::sscanf(line, "%511s %511s", key, value) != 2) continue;

			int const setting_name = setting_by_name(key);
			if (setting_name < 0) continue;

			switch (setting_name & settings_pack::type_mask)
			{
				case settings_pack::int_type_base:
					p.set_int(setting_name, std::atoi(value));
					break;
				case settings_pack::bool_type_base:
					p.set_bool(setting_name, parse_bool(value));
					break;
			}
		}

		if (std::ferror(f.get()))
			ec.assign(EIO, generic_category());
	}
}
