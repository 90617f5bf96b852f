/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_HASHER_HPP_INCLUDED
#define MESHXFER_HASHER_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/sha256_hash.hpp"

#include <string>
#include <vector>

#include <openssl/evp.h>

namespace meshxfer {

	// this is a SHA-256 hash class.
	//
	// You use it by first instantiating it, then call ``update()`` to feed it
	// with data. i.e. you don't have to keep the entire buffer of which you want to
	// create the hash in memory. You can feed the hasher parts of it at a time. When
	// You have fed the hasher with all the data, you call ``final()`` and it
	// will return the digest.
	//
	// The digest is computed by OpenSSL's libcrypto through the EVP interface.
	class MESHXFER_EXPORT hasher256
	{
	public:
		hasher256();

		// this is the same as default constructing followed by a call to
		// ``update(data, len)``.
		hasher256(char const* data, std::size_t len);
		explicit hasher256(std::vector<char> const& data);
		hasher256(hasher256 const&);
		hasher256& operator=(hasher256 const&) &;
		hasher256(hasher256&&) noexcept;
		hasher256& operator=(hasher256&&) & noexcept;

		// append the following bytes to what is being hashed
		hasher256& update(char const* data, std::size_t len);
		hasher256& update(std::vector<char> const& data);
		hasher256& update(sha256_hash const& h);

		// returns the SHA-256 digest of the buffers previously passed to
		// update() and the hasher constructor.
		sha256_hash final();

		// restore the hasher state to be as if the hasher has just been
		// default constructed.
		void reset();

		~hasher256();

	private:
		EVP_MD_CTX* m_context = nullptr;
	};

	// the lower case hex SHA-256 of a buffer. This is the form piece hashes
	// take on the wire
	MESHXFER_EXPORT std::string hash_hex(char const* data, std::size_t len);
	MESHXFER_EXPORT std::string hash_hex(std::vector<char> const& data);
}

#endif // MESHXFER_HASHER_HPP_INCLUDED
