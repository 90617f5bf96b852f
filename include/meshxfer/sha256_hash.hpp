/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_SHA256_HASH_HPP_INCLUDED
#define MESHXFER_SHA256_HASH_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/error_code.hpp"

#include <array>
#include <algorithm>
#include <cstring>
#include <iosfwd>
#include <string>

namespace meshxfer {

	// This type holds a SHA-256 digest. It is used for piece hashes, interior
	// Merkle nodes and Merkle roots. It is a value type, comparable and
	// ordered.
	class MESHXFER_EXPORT sha256_hash
	{
	public:

		// the size of the hash in bytes
		static constexpr std::size_t size() noexcept { return 32; }

		// constructs an all-zeros digest
		sha256_hash() noexcept { clear(); }

		// copies ``size()`` bytes from the pointer provided, into the digest.
		explicit sha256_hash(char const* s) noexcept { assign(s); }

		void assign(char const* s) noexcept
		{ std::memcpy(m_bytes.data(), s, size()); }

		// set all bytes to 0
		void clear() noexcept { m_bytes.fill(0); }

		// return true if all bytes are 0
		bool is_all_zeros() const noexcept
		{
			return std::all_of(m_bytes.begin(), m_bytes.end()
				, [](char const c) { return c == 0; });
		}

		bool operator==(sha256_hash const& n) const noexcept
		{ return m_bytes == n.m_bytes; }

		bool operator!=(sha256_hash const& n) const noexcept
		{ return m_bytes != n.m_bytes; }

		bool operator<(sha256_hash const& n) const noexcept
		{
			return std::memcmp(m_bytes.data(), n.m_bytes.data(), size()) < 0;
		}

		char* data() noexcept { return m_bytes.data(); }
		char const* data() const noexcept { return m_bytes.data(); }

		using const_iterator = std::array<char, 32>::const_iterator;
		const_iterator begin() const noexcept { return m_bytes.begin(); }
		const_iterator end() const noexcept { return m_bytes.end(); }

		// returns the raw 32 bytes of the digest
		std::string to_string() const { return std::string(data(), size()); }

		// returns the digest as 64 lower case hexadecimal characters
		std::string to_hex() const;

	private:
		std::array<char, 32> m_bytes;
	};

	// parses 64 hexadecimal characters (either case) into a digest. Any other
	// input sets ``ec`` to ``errors::malformed_hash``.
	MESHXFER_EXPORT sha256_hash sha256_from_hex(std::string const& hex, error_code& ec);

	// print a sha256_hash object to an ostream as 64 hexadecimal digits
	MESHXFER_EXPORT std::ostream& operator<<(std::ostream& os, sha256_hash const& h);
}

#endif // MESHXFER_SHA256_HASH_HPP_INCLUDED
