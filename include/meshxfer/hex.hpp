/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_HEX_HPP_INCLUDED
#define MESHXFER_HEX_HPP_INCLUDED

#include "meshxfer/config.hpp"

#include <string>
#include <cstddef>

namespace meshxfer::aux {

	// returns the value of a hexadecimal digit, or -1 if ``in`` is not one.
	// Both upper and lower case digits are accepted
	MESHXFER_EXTRA_EXPORT int hex_to_int(char in);

	MESHXFER_EXTRA_EXPORT bool is_hex(char const* in, std::size_t len);

	// converts ``len`` bytes at ``in`` into 2 * ``len`` lower case
	// hexadecimal characters
	MESHXFER_EXTRA_EXPORT std::string to_hex(char const* in, std::size_t len);

	// converts the hex string ``in`` of length ``len`` into len / 2 bytes
	// written to ``out``. Returns false if ``len`` is odd or ``in`` contains
	// a character that is not a hex digit
	MESHXFER_EXTRA_EXPORT bool from_hex(char const* in, std::size_t len, char* out);

	// returns ``in`` with every upper case hex digit turned to lower case
	MESHXFER_EXTRA_EXPORT std::string to_lower_hex(std::string in);

}

#endif // MESHXFER_HEX_HPP_INCLUDED
