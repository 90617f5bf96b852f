/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/hex.hpp"

#include <cstdint>

namespace meshxfer::aux {

	int hex_to_int(char const in)
	{
		if (in >= '0' && in <= '9') return int(in) - '0';
		if (in >= 'A' && in <= 'F') return int(in) - 'A' + 10;
		if (in >= 'a' && in <= 'f') return int(in) - 'a' + 10;
		return -1;
	}

	bool is_hex(char const* in, std::size_t const len)
	{
		for (std::size_t i = 0; i < len; ++i)
		{
			if (hex_to_int(in[i]) == -1) return false;
		}
		return true;
	}

	bool from_hex(char const* in, std::size_t const len, char* out)
	{
		if (len % 2 != 0) return false;
		for (char const* end = in + len; in != end; ++out)
		{
			int const t1 = hex_to_int(*in++);
			if (t1 == -1) return false;
			int const t2 = hex_to_int(*in++);
			if (t2 == -1) return false;
			*out = char((t1 << 4) | (t2 & 15));
		}
		return true;
	}

	extern char const hex_chars[];

	char const hex_chars[] = "0123456789abcdef";

	std::string to_hex(char const* in, std::size_t const len)
	{
		std::string ret;
		ret.resize(len * 2);
		std::size_t idx = 0;
		for (std::size_t i = 0; i < len; ++i)
		{
			ret[idx++] = hex_chars[std::uint8_t(in[i]) >> 4];
			ret[idx++] = hex_chars[std::uint8_t(in[i]) & 0xf];
		}
		return ret;
	}

	std::string to_lower_hex(std::string in)
	{
		for (auto& c : in)
		{
			if (c >= 'A' && c <= 'F') c = char(c - 'A' + 'a');
		}
		return in;
	}

}
