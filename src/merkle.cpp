/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "meshxfer/merkle.hpp"
#include "meshxfer/hasher.hpp"
#include "meshxfer/assert.hpp"

namespace meshxfer {

	sha256_hash merkle_parent(sha256_hash const& left, sha256_hash const& right)
	{
		return hasher256().update(left).update(right).final();
	}

	sha256_hash merkle_root(std::vector<sha256_hash> const& leaves)
	{
		std::vector<sha256_hash> scratch;
		return merkle_root_scratch(leaves, scratch);
	}

	sha256_hash merkle_root_scratch(std::vector<sha256_hash> const& leaves
		, std::vector<sha256_hash>& scratch)
	{
		if (leaves.empty()) return hasher256().final();
		if (leaves.size() == 1) return leaves[0];

		scratch.assign(leaves.begin(), leaves.end());
		std::size_t level_size = scratch.size();

		while (level_size > 1)
		{
			std::size_t i = 0;
			for (; i < level_size / 2; ++i)
				scratch[i] = merkle_parent(scratch[i * 2], scratch[i * 2 + 1]);

			if (level_size & 1)
			{
				// an odd node out is paired with itself
				scratch[i] = merkle_parent(scratch[i * 2], scratch[i * 2]);
				++i;
			}
			level_size = i;
		}
		MESHXFER_ASSERT(level_size == 1);
		return scratch[0];
	}

	std::optional<std::string> merkle_root(std::vector<std::string> const& hex_leaves)
	{
		std::vector<sha256_hash> leaves;
		leaves.reserve(hex_leaves.size());
		for (auto const& h : hex_leaves)
		{
			error_code ec;
			leaves.push_back(sha256_from_hex(h, ec));
			if (ec) return std::nullopt;
		}
		return merkle_root(leaves).to_hex();
	}
}
