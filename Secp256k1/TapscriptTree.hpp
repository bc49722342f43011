#ifndef SECP256K1_TAPSCRIPTTREE_HPP
#define SECP256K1_TAPSCRIPTTREE_HPP

#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 { namespace TapTree {

/* Thrown in case of being fed an invalid argument.  */
class InvalidArg : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidArg(std::string arg)
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid argument: " + arg
		  ) { }
};

/* `0xc0 || compact_size(len) || script`, the preimage
 * of a leaf hash.  */
std::vector<std::uint8_t>
encoded_leaf(std::vector<std::uint8_t> const& script);

Sha256::Hash leaf_hash(std::vector<std::uint8_t> const& script);
/* Orders the children bytewise before hashing.  */
Sha256::Hash branch_hash(Sha256::Hash const& a, Sha256::Hash const& b);

/** struct Secp256k1::TapTree::Tree
 *
 * @brief a script tree over a list of leaf
 * scripts, with the merkle path of each leaf.
 *
 * @desc `paths[i]` lists sibling hashes from
 * the leaf upwards, the order used in a
 * control block.
 */
struct Tree {
	Sha256::Hash root;
	std::vector<Sha256::Hash> leaves;
	std::vector<std::vector<Sha256::Hash>> paths;
};

/** Secp256k1::TapTree::build
 *
 * @brief builds a balanced tree, splitting the
 * leaves so that the first subtree takes the
 * larger half.
 *
 * @desc Leaf order is significant: the same
 * scripts in the same order always give the
 * same root.
 * Throws `InvalidArg` on an empty list.
 */
Tree build(std::vector<std::vector<std::uint8_t>> const& scripts);

}}

#endif /* !defined(SECP256K1_TAPSCRIPTTREE_HPP) */
