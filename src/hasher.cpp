/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/hasher.hpp"
#include "meshxfer/aux_/throw.hpp"

#include <new> // for bad_alloc
#include <stdexcept>
#include <utility>

namespace meshxfer {

namespace {

	void check_evp(int const ret, char const* function)
	{
		if (ret != 1) aux::throw_ex<std::runtime_error>(function);
	}
}

	hasher256::hasher256()
		: m_context(EVP_MD_CTX_new())
	{
		if (m_context == nullptr) aux::throw_ex<std::bad_alloc>();
		check_evp(EVP_DigestInit_ex(m_context, EVP_sha256(), nullptr)
			, "EVP_DigestInit_ex");
	}

	hasher256::hasher256(char const* data, std::size_t const len)
		: hasher256()
	{
		update(data, len);
	}

	hasher256::hasher256(std::vector<char> const& data)
		: hasher256()
	{
		update(data);
	}

	hasher256::hasher256(hasher256 const& h)
		: hasher256()
	{
		check_evp(EVP_MD_CTX_copy_ex(m_context, h.m_context), "EVP_MD_CTX_copy_ex");
	}

	hasher256& hasher256::operator=(hasher256 const& h) &
	{
		if (this == &h) return *this;
		check_evp(EVP_MD_CTX_copy_ex(m_context, h.m_context), "EVP_MD_CTX_copy_ex");
		return *this;
	}

	hasher256::hasher256(hasher256&& h) noexcept
	{
		std::swap(m_context, h.m_context);
	}

	hasher256& hasher256::operator=(hasher256&& h) & noexcept
	{
		if (this == &h) return *this;
		std::swap(m_context, h.m_context);
		return *this;
	}

	hasher256& hasher256::update(char const* data, std::size_t const len)
	{
		if (len == 0) return *this;
		check_evp(EVP_DigestUpdate(m_context
			, reinterpret_cast<unsigned char const*>(data), len)
			, "EVP_DigestUpdate");
		return *this;
	}

	hasher256& hasher256::update(std::vector<char> const& data)
	{
		return update(data.data(), data.size());
	}

	hasher256& hasher256::update(sha256_hash const& h)
	{
		return update(h.data(), h.size());
	}

	sha256_hash hasher256::final()
	{
		sha256_hash digest;
		check_evp(EVP_DigestFinal_ex(m_context
			, reinterpret_cast<unsigned char*>(digest.data()), nullptr)
			, "EVP_DigestFinal_ex");
		return digest;
	}

	void hasher256::reset()
	{
		check_evp(EVP_DigestInit_ex(m_context, EVP_sha256(), nullptr)
			, "EVP_DigestInit_ex");
	}

	hasher256::~hasher256()
	{
		if (m_context) EVP_MD_CTX_free(m_context);
	}

	std::string hash_hex(char const* data, std::size_t const len)
	{
		return hasher256(data, len).final().to_hex();
	}

	std::string hash_hex(std::vector<char> const& data)
	{
		return hash_hex(data.data(), data.size());
	}
}
