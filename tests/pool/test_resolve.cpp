#undef NDEBUG
#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Ctv/Template.hpp"
#include"Ctv/covenant_script.hpp"
#include"Pool/Error.hpp"
#include"Pool/Tree.hpp"
#include"Pool/resolve.hpp"
#include"Sha256/fun.hpp"
#include<algorithm>
#include<assert.h>
#include<cstdint>
#include<string>
#include<vector>

namespace {

std::vector<Pool::Participant> users(std::size_t n) {
	auto addrs = std::vector<std::string>();
	for (auto i = std::size_t(0); i < n; ++i) {
		auto spk = std::vector<std::uint8_t>(34, std::uint8_t(0x40 + i));
		spk[0] = 0x00;
		spk[1] = 0x20;
		addrs.push_back(Bitcoin::scriptPubKey_to_addr(
			spk, Bitcoin::Network::Regtest
		));
	}
	return Pool::make_participants(addrs, Bitcoin::Network::Regtest);
}

Bitcoin::OutPoint funding() {
	std::uint8_t buf[] = {'f', 'u', 'n', 'd'};
	return Bitcoin::OutPoint(Bitcoin::TxId(Sha256::fun(buf, sizeof(buf))), 1);
}

/* Walks one exit order to the end, checking each step.  */
void walk(Pool::Tree const& t, std::vector<std::size_t> const& order) {
	auto const& c = t.get_config();
	auto const& ps = t.get_participants();
	auto n = c.users;

	auto outpoint = funding();
	auto path = Pool::Path();
	for (auto k = std::size_t(0); k + 1 < n; ++k) {
		auto u = order[k];
		auto res = Pool::resolve(t, ps, c, outpoint, path, u);

		auto const& tx = res.tx;
		assert(tx.inputs.size() == 1);
		assert(tx.inputs[0].prevout.txid == outpoint.txid);
		assert(tx.inputs[0].prevout.vout == outpoint.vout);

		/* Script path spend: leaf script, then
		 * control block.  */
		auto const& w = tx.inputs[0].witness;
		assert(w.size() == 2);
		auto const* leaf = t.lookup(path)->leaf_for(u);
		assert(leaf);
		assert(w[0] == leaf->script);
		assert(w[1] == leaf->control_block);
		assert(Ctv::covenant_commitment(w[0]) == Ctv::template_hash(tx, 0));

		assert(tx.outputs[0].scriptPubKey == ps[u].scriptPubKey);
		assert(tx.outputs[0].amount == c.payout());

		auto expected_path = path;
		expected_path.push_back(u);
		assert(res.next_path == expected_path);

		if (k + 2 < n) {
			assert(res.continuation);
			assert(res.continuation->txid == tx.txid());
			assert(res.continuation->vout == 2);
			auto next = t.lookup(res.next_path);
			assert(next);
			assert(tx.outputs[2].scriptPubKey == next->taproot.scriptPubKey);
			assert(tx.outputs[2].amount == next->value);
			outpoint = *res.continuation;
		} else {
			/* The one nobody named is paid the rest.  */
			assert(!res.continuation);
			auto last = order[n - 1];
			assert(tx.outputs[2].scriptPubKey == ps[last].scriptPubKey);
			assert(tx.outputs[2].amount == c.terminal_residual());
		}
		path = res.next_path;
	}
}

template<typename e>
void expect_throw( Pool::Tree const& t
		 , Pool::Config const& c
		 , std::vector<Pool::Participant> const& ps
		 , Pool::Path const& path
		 , std::size_t u
		 ) {
	auto threw = false;
	try {
		Pool::resolve(t, ps, c, funding(), path, u);
	} catch (e const&) {
		threw = true;
	}
	assert(threw);
}

}

int main() {
	auto c = Pool::Config();
	c.users = 4;
	auto ps = users(4);
	auto t = Pool::Tree::build(c, ps);

	/* Every exit order settles.  */
	auto order = std::vector<std::size_t>{0, 1, 2, 3};
	auto count = 0;
	do {
		walk(t, order);
		++count;
	} while (std::next_permutation(order.begin(), order.end()));
	assert(count == 24);

	/* Unknown or repeated exiters.  */
	expect_throw<Pool::ResolveError>(t, c, ps, {1}, 1);
	expect_throw<Pool::ResolveError>(t, c, ps, {}, 4);
	expect_throw<Pool::ResolveError>(t, c, ps, {2, 2}, 0);
	/* Already fully paid out.  */
	expect_throw<Pool::ResolveError>(t, c, ps, {0, 1, 2}, 3);
	/* Participant list of the wrong size.  */
	expect_throw<Pool::ResolveError>(t, c, users(3), {}, 0);

	/* Parameters other than those the tree was built
	 * with rebuild a different transaction.  */
	{
		auto other = c;
		other.fee = Bitcoin::Amount::sat(999);
		expect_throw<Pool::CommitmentMismatch>(t, other, ps, {}, 0);
		other = c;
		other.sequence = 0xffffffff;
		expect_throw<Pool::CommitmentMismatch>(t, other, ps, {1}, 0);
	}
	{
		auto other = ps;
		other[0].scriptPubKey[5] ^= 1;
		expect_throw<Pool::CommitmentMismatch>(t, c, other, {}, 0);
	}

	/* The three-user pool: two steps.  */
	{
		auto c3 = Pool::Config();
		auto t3 = Pool::Tree::build(c3, users(3));
		walk(t3, {2, 0, 1});
		walk(t3, {1, 2, 0});
	}

	return 0;
}
