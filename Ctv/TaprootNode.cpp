#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Ctv/TaprootNode.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Secp256k1/tagged_hashes.hpp"

namespace Ctv {

Secp256k1::XonlyPubKey nums_key() {
	return Secp256k1::XonlyPubKey(
		"50929b74c1a04954b78b4b6035e97a5e078a5a0f28ec96d547bfee9ace803ac0"
	);
}

TaprootNode
TaprootNode::compile( std::vector<std::vector<std::uint8_t>> const& leaves
		    , Bitcoin::Network network
		    ) {
	return compile(leaves, network, nums_key());
}

TaprootNode
TaprootNode::compile( std::vector<std::vector<std::uint8_t>> const& leaves
		    , Bitcoin::Network network
		    , Secp256k1::XonlyPubKey const& internal_key
		    ) {
	auto tree = Secp256k1::TapTree::build(leaves);

	auto rv = TaprootNode();
	rv.internal_key = internal_key;
	rv.merkle_root = tree.root;
	rv.leaf_hashes = std::move(tree.leaves);

	std::uint8_t p[32];
	rv.internal_key.to_buffer(p);

	/* t = TapTweak(P || root)  */
	auto preimage = std::vector<std::uint8_t>(64);
	rv.internal_key.to_buffer(&preimage[0]);
	rv.merkle_root.to_buffer(&preimage[32]);
	std::uint8_t tweak[32];
	Secp256k1::tagged_hash(tweak, preimage.data(), preimage.size(), Tag::TWEAK);

	rv.output_key = rv.internal_key.tweak_add(tweak, rv.parity);

	rv.scriptPubKey.resize(34);
	rv.scriptPubKey[0] = 0x51;
	rv.scriptPubKey[1] = 0x20;
	rv.output_key.to_buffer(&rv.scriptPubKey[2]);
	rv.address = Bitcoin::scriptPubKey_to_addr(rv.scriptPubKey, network);

	rv.control_blocks.reserve(tree.paths.size());
	for (auto const& path : tree.paths) {
		auto cb = std::vector<std::uint8_t>(33 + 32 * path.size());
		cb[0] = std::uint8_t(0xc0 | (rv.parity & 1));
		std::copy(p, p + 32, cb.begin() + 1);
		auto off = std::size_t(33);
		for (auto const& h : path) {
			h.to_buffer(&cb[off]);
			off += 32;
		}
		rv.control_blocks.push_back(std::move(cb));
	}

	return rv;
}

}
