#undef NDEBUG
#include"Bitcoin/Network.hpp"
#include"Ctv/TaprootNode.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Secp256k1/tagged_hashes.hpp"
#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<assert.h>
#include<cstdint>
#include<string>
#include<vector>

namespace {

using Secp256k1::TapTree::branch_hash;
using Secp256k1::TapTree::leaf_hash;

std::vector<std::vector<std::uint8_t>> scripts(std::size_t n) {
	auto rv = std::vector<std::vector<std::uint8_t>>();
	for (auto i = std::size_t(0); i < n; ++i)
		/* <i> OP_DROP OP_TRUE  */
		rv.push_back({0x01, std::uint8_t(i), 0x75, 0x51});
	return rv;
}

/* Walk a control block path back up to the root.  */
Sha256::Hash climb(Sha256::Hash h, std::vector<std::uint8_t> const& cb) {
	for (auto off = std::size_t(33); off < cb.size(); off += 32) {
		auto sibling = Sha256::Hash();
		sibling.from_buffer(&cb[off]);
		h = branch_hash(h, sibling);
	}
	return h;
}

void test_bip341_vector() {
	auto internal = Secp256k1::XonlyPubKey(
		"187791b6f712a8ea41c8ecdd0ee77fab3e85263b37e1ec18a3651926b3a6cf27"
	);
	auto script = Util::Str::hexread(
		"20d85a959b0290bf19bb89ed43c916be835475d013da4b362117393e25a48229b8ac"
	);
	auto node = Ctv::TaprootNode::compile( {script}
					     , Bitcoin::Network::Mainnet
					     , internal
					     );
	assert( Util::Str::hexdump(node.scriptPubKey)
	     == "5120147c9c57132f6e7ecddba9800bb0c4449251c92a1e60371ee77557b6620f3ea3"
	      );
	assert(node.address == "bc1pz37fc4cn9ah8anwm4xqqhvxygjf9rjf2resrw8h8w4tmvcs0863sa2e586");
	assert(node.control_blocks.size() == 1);
	assert( Util::Str::hexdump(node.control_blocks[0])
	     == "c1187791b6f712a8ea41c8ecdd0ee77fab3e85263b37e1ec18a3651926b3a6cf27"
	      );
	assert(node.parity == 1);
	/* A lone leaf is its own root.  */
	assert(node.merkle_root == leaf_hash(script));
	assert(node.leaf_hashes[0] == node.merkle_root);
}

void test_leaf_encoding() {
	auto s = std::vector<std::uint8_t>{0x51};
	auto enc = Secp256k1::TapTree::encoded_leaf(s);
	assert((enc == std::vector<std::uint8_t>{0xc0, 0x01, 0x51}));
	assert(leaf_hash(s) == Secp256k1::tagged_hash(Tag::LEAF, enc));

	/* Branch hashing ignores child order.  */
	auto a = leaf_hash({0x51});
	auto b = leaf_hash({0x52});
	assert(branch_hash(a, b) == branch_hash(b, a));
	assert(branch_hash(a, b) != branch_hash(a, a));
}

void test_balanced_shape() {
	auto s = scripts(3);
	auto l0 = leaf_hash(s[0]);
	auto l1 = leaf_hash(s[1]);
	auto l2 = leaf_hash(s[2]);

	/* The first subtree takes the larger half.  */
	auto t = Secp256k1::TapTree::build(s);
	assert(t.root == branch_hash(branch_hash(l0, l1), l2));
	assert(t.paths[0].size() == 2);
	assert(t.paths[0][0] == l1);
	assert(t.paths[2].size() == 1);
	assert(t.paths[2][0] == branch_hash(l0, l1));

	s = scripts(4);
	t = Secp256k1::TapTree::build(s);
	assert(t.root == branch_hash( branch_hash(leaf_hash(s[0]), leaf_hash(s[1]))
				    , branch_hash(leaf_hash(s[2]), leaf_hash(s[3]))
				    ));

	auto threw = false;
	try {
		Secp256k1::TapTree::build({});
	} catch (Secp256k1::TapTree::InvalidArg const&) {
		threw = true;
	}
	assert(threw);
}

void test_control_blocks() {
	for (auto n = std::size_t(1); n <= 9; ++n) {
		auto s = scripts(n);
		auto node = Ctv::TaprootNode::compile(s, Bitcoin::Network::Regtest);

		assert(node.internal_key == Ctv::nums_key());
		assert(node.address.substr(0, 6) == "bcrt1p");
		assert(node.control_blocks.size() == n);
		assert(node.leaf_hashes.size() == n);

		std::uint8_t nums[32];
		Ctv::nums_key().to_buffer(nums);
		for (auto i = std::size_t(0); i < n; ++i) {
			auto const& cb = node.control_blocks[i];
			assert(cb.size() >= 33);
			assert((cb.size() - 33) % 32 == 0);
			assert(cb[0] == (0xc0 | node.parity));
			assert(std::equal(nums, nums + 32, cb.begin() + 1));
			assert(node.leaf_hashes[i] == leaf_hash(s[i]));
			assert(climb(node.leaf_hashes[i], cb) == node.merkle_root);
		}

		/* Q = P + TapTweak(P || root) G  */
		auto preimage = std::vector<std::uint8_t>(64);
		Ctv::nums_key().to_buffer(&preimage[0]);
		node.merkle_root.to_buffer(&preimage[32]);
		std::uint8_t tweak[32];
		Secp256k1::tagged_hash(tweak, preimage.data(), preimage.size(), Tag::TWEAK);
		auto parity = int();
		auto q = Ctv::nums_key().tweak_add(tweak, parity);
		assert(q == node.output_key);
		assert(parity == node.parity);

		/* Deterministic.  */
		auto again = Ctv::TaprootNode::compile(s, Bitcoin::Network::Regtest);
		assert(again.scriptPubKey == node.scriptPubKey);
		assert(again.control_blocks == node.control_blocks);
	}
}

}

int main() {
	test_bip341_vector();
	test_leaf_encoding();
	test_balanced_shape();
	test_control_blocks();
	return 0;
}
