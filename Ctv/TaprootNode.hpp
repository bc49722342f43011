#ifndef CTV_TAPROOTNODE_HPP
#define CTV_TAPROOTNODE_HPP

#include"Bitcoin/Network.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Ctv {

/* The BIP-341 point with no known discrete log,
 * used so that only script paths can spend.  */
Secp256k1::XonlyPubKey nums_key();

/** struct Ctv::TaprootNode
 *
 * @brief a taproot output whose script tree
 * holds a given list of leaf scripts, with
 * everything needed to spend any leaf.
 *
 * @desc `leaf_hashes[i]` and `control_blocks[i]`
 * belong to the i-th leaf as given to
 * `compile`.
 */
struct TaprootNode {
	Secp256k1::XonlyPubKey internal_key;
	Secp256k1::XonlyPubKey output_key;
	/* 1 if the output key has odd Y.  */
	int parity;
	Sha256::Hash merkle_root;
	std::vector<std::uint8_t> scriptPubKey;
	std::string address;
	std::vector<Sha256::Hash> leaf_hashes;
	std::vector<std::vector<std::uint8_t>> control_blocks;

	TaprootNode() : parity(0) { }

	/** Ctv::TaprootNode::compile
	 *
	 * @brief builds the balanced script tree,
	 * tweaks the NUMS key with its root, and
	 * derives the output script, the address
	 * and one control block per leaf.
	 *
	 * @desc Throws `Secp256k1::TapTree::InvalidArg`
	 * if `leaves` is empty.
	 */
	static
	TaprootNode compile( std::vector<std::vector<std::uint8_t>> const& leaves
			   , Bitcoin::Network network
			   );
	/* As above, with a caller-chosen internal key.  */
	static
	TaprootNode compile( std::vector<std::vector<std::uint8_t>> const& leaves
			   , Bitcoin::Network network
			   , Secp256k1::XonlyPubKey const& internal_key
			   );
};

}

#endif /* !defined(CTV_TAPROOTNODE_HPP) */
