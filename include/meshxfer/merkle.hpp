/*

Copyright (c) 2026, meshxfer contributors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef MESHXFER_MERKLE_HPP_INCLUDED
#define MESHXFER_MERKLE_HPP_INCLUDED

#include "meshxfer/config.hpp"
#include "meshxfer/sha256_hash.hpp"

#include <optional>
#include <string>
#include <vector>

namespace meshxfer {

	// returns SHA-256(left || right), the parent of two nodes in the tree
	MESHXFER_EXTRA_EXPORT sha256_hash merkle_parent(sha256_hash const& left
		, sha256_hash const& right);

	// compute the root of the binary hash tree over ``leaves``, in order.
	// Each level pairs neighbouring nodes. A level with an odd number of
	// nodes pairs its last node with itself. A single leaf is its own root
	// and an empty list yields the hash of the empty string.
	MESHXFER_EXPORT sha256_hash merkle_root(std::vector<sha256_hash> const& leaves);

	// same as above, but on leaves and root in their lower case hex form. If
	// any leaf is not a valid hex encoded digest, no root is returned.
	MESHXFER_EXPORT std::optional<std::string> merkle_root(
		std::vector<std::string> const& hex_leaves);

	// compute the tree in place, level by level. ``scratch`` is reused between
	// levels to avoid allocating.
	MESHXFER_EXTRA_EXPORT sha256_hash merkle_root_scratch(
		std::vector<sha256_hash> const& leaves
		, std::vector<sha256_hash>& scratch);
}

#endif // MESHXFER_MERKLE_HPP_INCLUDED
