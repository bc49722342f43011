#undef NDEBUG
#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Ctv/Template.hpp"
#include"Ctv/covenant_script.hpp"
#include"Pool/Error.hpp"
#include"Pool/Tree.hpp"
#include"Secp256k1/TapscriptTree.hpp"
#include<assert.h>
#include<cstdint>
#include<string>
#include<utility>
#include<vector>

namespace {

std::vector<Pool::Participant> users(std::size_t n) {
	auto addrs = std::vector<std::string>();
	for (auto i = std::size_t(0); i < n; ++i) {
		auto spk = std::vector<std::uint8_t>(22, std::uint8_t(0x10 + i));
		spk[0] = 0x00;
		spk[1] = 0x14;
		addrs.push_back(Bitcoin::scriptPubKey_to_addr(
			spk, Bitcoin::Network::Regtest
		));
	}
	return Pool::make_participants(addrs, Bitcoin::Network::Regtest);
}

Pool::Config config(std::size_t n) {
	auto c = Pool::Config();
	c.users = n;
	return c;
}

void check_node(Pool::Tree const& t, Pool::Node const& node) {
	auto const& c = t.get_config();
	auto const& ps = t.get_participants();
	auto n = c.users;

	assert(node.depth == n - 2 - node.exited.size());
	assert(node.value == c.node_value(node.exited.size()));
	assert(node.leaves.size() == n - node.exited.size());
	assert(node.taproot.control_blocks.size() == node.leaves.size());

	auto prev = std::size_t(0);
	for (auto i = std::size_t(0); i < node.leaves.size(); ++i) {
		auto const& l = node.leaves[i];
		/* Ascending, remaining users only.  */
		assert(i == 0 || l.exiter > prev);
		prev = l.exiter;
		assert(!Pool::contains(node.exited, l.exiter));
		assert(node.leaf_for(l.exiter) == &l);

		assert(l.commitment == Ctv::template_hash(l.tx, 0));
		assert(l.script == Ctv::covenant_script(l.commitment));
		assert(l.control_block == node.taproot.control_blocks[i]);
		assert(node.taproot.leaf_hashes[i] == Secp256k1::TapTree::leaf_hash(l.script));

		auto const& tx = l.tx;
		assert(tx.version == c.tx_version);
		assert(tx.locktime == c.lock_time);
		assert(tx.inputs.size() == 1);
		assert(tx.inputs[0].sequence == c.sequence);
		assert(tx.inputs[0].witness.empty());
		assert(tx.outputs.size() == 3);
		assert(tx.outputs[0].scriptPubKey == ps[l.exiter].scriptPubKey);
		assert(tx.outputs[0].amount == c.payout());
		assert(tx.outputs[1].scriptPubKey == c.fee_anchor_spk);
		assert(tx.outputs[1].amount == c.fee);
		/* Nothing created, the fee left for the miner.  */
		assert( tx.outputs[0].amount + tx.outputs[1].amount
		      + tx.outputs[2].amount + c.fee
		     == node.value
		      );
		assert(tx.outputs[2].amount > c.dust);

		if (node.terminal()) {
			assert(l.other != l.exiter);
			assert(!Pool::contains(node.exited, l.other));
			assert(tx.outputs[2].scriptPubKey == ps[l.other].scriptPubKey);
			assert(tx.outputs[2].amount == c.terminal_residual());
		} else {
			auto child = t.lookup(Pool::with(node.exited, l.exiter));
			assert(child);
			assert(tx.outputs[2].scriptPubKey == child->taproot.scriptPubKey);
			assert(tx.outputs[2].amount == child->value);
		}
	}
}

void test_shape(std::size_t n) {
	auto t = Pool::Tree::build(config(n), users(n));

	/* 2^N - N - 1  */
	assert(t.size() == (std::size_t(1) << n) - n - 1);
	assert(t.root_depth() == n - 2);

	auto const& root = t.root();
	assert(root.exited.empty());
	assert(root.value == t.get_config().total());
	assert(root.leaves.size() == n);
	assert(t.lookup({}) == &root);

	for (auto d = std::size_t(0); d <= t.root_depth(); ++d)
		for (auto const& e : t.layer(d)) {
			assert(e.first == e.second.exited);
			check_node(t, e.second);
		}
}

void test_lookup() {
	auto t = Pool::Tree::build(config(4), users(4));

	/* Shared by both exit orders.  */
	auto a = t.lookup({2, 0});
	auto b = t.lookup({0, 2});
	assert(a && a == b);
	assert(a->terminal());
	assert((a->exited == Pool::Path{0, 2}));

	/* Past the terminal layer.  */
	assert(!t.lookup({0, 1, 2}));
	/* Out of range user.  */
	assert(!t.lookup({7}));

	auto threw = false;
	try {
		t.lookup({1, 1});
	} catch (Pool::ResolveError const&) {
		threw = true;
	}
	assert(threw);
}

void test_deterministic() {
	auto a = Pool::Tree::build(config(4), users(4));
	auto b = Pool::Tree::build(config(4), users(4));
	assert(a.root().taproot.scriptPubKey == b.root().taproot.scriptPubKey);
	assert(a.root().taproot.address == b.root().taproot.address);
	for (auto i = std::size_t(0); i < 4; ++i)
		assert(a.root().leaves[i].commitment == b.root().leaves[i].commitment);

	/* Every parameter feeds the commitments.  */
	auto c = config(4);
	c.fee = Bitcoin::Amount::sat(1001);
	auto d = Pool::Tree::build(c, users(4));
	assert(d.root().taproot.scriptPubKey != a.root().taproot.scriptPubKey);

	c = config(4);
	c.tx_version = 3;
	d = Pool::Tree::build(c, users(4));
	assert(d.root().taproot.scriptPubKey != a.root().taproot.scriptPubKey);

	auto ps = users(4);
	std::swap(ps[1].scriptPubKey, ps[2].scriptPubKey);
	d = Pool::Tree::build(config(4), ps);
	assert(d.root().taproot.scriptPubKey != a.root().taproot.scriptPubKey);
}

void test_rejects() {
	auto threw = false;
	try {
		Pool::Tree::build(config(4), users(3));
	} catch (Pool::ConfigError const&) {
		threw = true;
	}
	assert(threw);

	threw = false;
	try {
		Pool::Tree::build(config(2), users(2));
	} catch (Pool::ConfigError const&) {
		threw = true;
	}
	assert(threw);

	threw = false;
	try {
		auto ps = users(3);
		ps[2].index = 5;
		Pool::Tree::build(config(3), ps);
	} catch (Pool::ConfigError const&) {
		threw = true;
	}
	assert(threw);
}

}

int main() {
	test_shape(3);
	test_shape(4);
	test_shape(5);
	test_lookup();
	test_deterministic();
	test_rejects();
	return 0;
}
