/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_LOAD_CONFIG_HPP_INCLUDED
#define MESHXFER_LOAD_CONFIG_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/error_code.hpp"
#include "meshxfer/settings_pack.hpp"

#include <string>

namespace meshxfer {

	// this function lets you load configurations straight from a simple
	// text file, where each line is a key value pair separated by white
	// space. The keys are the names of the settings_pack settings. The values
	// are either integers or booleans (``true``, ``false``, ``1`` or ``0``).
	// Empty lines and lines starting with ``#`` are ignored, as are unknown
	// keys. Values found in the file are set in ``p``, other settings are
	// left untouched.
	MESHXFER_EXPORT void load_config(std::string const& config_file
		, settings_pack& p, error_code& ec);
}

#endif // MESHXFER_LOAD_CONFIG_HPP_INCLUDED
