/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/sha256_hash.hpp"
#include "meshxfer/hex.hpp"

#include <ostream>

namespace meshxfer {

	std::string sha256_hash::to_hex() const
	{
		return aux::to_hex(data(), size());
	}

	sha256_hash sha256_from_hex(std::string const& hex, error_code& ec)
	{
		sha256_hash ret;
		if (hex.size() != sha256_hash::size() * 2
			|| !aux::from_hex(hex.data(), hex.size(), ret.data()))
		{
			ec = errors::malformed_hash;
			return sha256_hash();
		}
		return ret;
	}

	std::ostream& operator<<(std::ostream& os, sha256_hash const& h)
	{
		return os << h.to_hex();
	}
}
