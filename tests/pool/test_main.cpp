#undef NDEBUG
#include"Bitcoin/Amount.hpp"
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Pool/Error.hpp"
#include"Pool/Main.hpp"
#include"Pool/NodeIF.hpp"
#include"Sha256/fun.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>
#include<vector>

namespace {

std::string regtest_addr(std::uint8_t fill) {
	auto spk = std::vector<std::uint8_t>(22, fill);
	spk[0] = 0x00;
	spk[1] = 0x14;
	return Bitcoin::scriptPubKey_to_addr(spk, Bitcoin::Network::Regtest);
}

bool has(std::string const& haystack, std::string const& needle) {
	return haystack.find(needle) != std::string::npos;
}

/* What the fake node saw.  */
struct Chain {
	std::size_t opened;
	std::string url;
	std::string funded_address;
	Bitcoin::Amount funded_amount;
	/* Pay short of the requested amount.  */
	bool shortchange;
	std::size_t blocks;
	std::size_t addresses;
	std::vector<Bitcoin::Tx> sent;

	Chain() : opened(0), shortchange(false), blocks(0), addresses(0) { }
};

class FakeNode : public Pool::NodeIF {
private:
	std::shared_ptr<Chain> chain;

	static Bitcoin::TxId funding_txid() {
		std::uint8_t buf[] = {0xf0};
		return Bitcoin::TxId(Sha256::fun(buf, sizeof(buf)));
	}

public:
	explicit
	FakeNode(std::shared_ptr<Chain> chain_) : chain(std::move(chain_)) { }

	Ev::Io<Bitcoin::TxId>
	fund(std::string const& address, Bitcoin::Amount amount) override {
		chain->funded_address = address;
		chain->funded_amount = amount;
		return Ev::lift(funding_txid());
	}
	Ev::Io<Bitcoin::TxId>
	broadcast(Bitcoin::Tx const& tx) override {
		chain->sent.push_back(tx);
		return Ev::lift(tx.txid());
	}
	Ev::Io<std::vector<Bitcoin::TxOut>>
	lookup_outputs(Bitcoin::TxId const& txid) override {
		assert(txid == funding_txid());
		auto outs = std::vector<Bitcoin::TxOut>();
		/* Change comes first.  */
		auto change = Bitcoin::TxOut();
		change.amount = Bitcoin::Amount::sat(12345);
		change.scriptPubKey = Bitcoin::addr_to_scriptPubKey(regtest_addr(0xcc));
		outs.push_back(change);
		auto pool = Bitcoin::TxOut();
		pool.amount = chain->funded_amount;
		if (chain->shortchange)
			pool.amount -= Bitcoin::Amount::sat(1);
		pool.scriptPubKey = Bitcoin::addr_to_scriptPubKey(
			chain->funded_address
		);
		outs.push_back(pool);
		return Ev::lift(outs);
	}
	Ev::Io<std::string> new_address() override {
		++chain->addresses;
		return Ev::lift(regtest_addr(std::uint8_t(chain->addresses)));
	}
	Ev::Io<Bitcoin::Amount> get_balance() override {
		return Ev::lift(Bitcoin::Amount::sat(
			chain->blocks >= 101 ? 5000000000ULL : 0
		));
	}
	Ev::Io<void> generate(std::size_t blocks) override {
		chain->blocks += blocks;
		return Ev::lift();
	}
};

struct Result {
	int code;
	std::string out;
	std::string err;
};

Result run( std::vector<std::string> args
	  , std::shared_ptr<Chain> chain = std::make_shared<Chain>()
	  ) {
	auto out = std::ostringstream();
	auto err = std::ostringstream();
	args.insert(args.begin(), "ctvpool");

	auto opener = [chain]( Ev::ThreadPool&
			     , Bitcoin::Network
			     , std::string const& url
			     , std::string const&
			     , std::string const&
			     ) {
		++chain->opened;
		chain->url = url;
		return std::unique_ptr<Pool::NodeIF>(
			Util::make_unique<FakeNode>(chain)
		);
	};
	auto m = std::make_shared<Pool::Main>(args, out, err, opener);
	auto code = Ev::start(m->run().then([m](int c) {
		return Ev::lift(c);
	}));
	return Result{code, out.str(), err.str()};
}

void test_help_version() {
	auto r = run({"--help"});
	assert(r.code == 0);
	assert(has(r.out, "Usage: ctvpool"));
	assert(has(r.out, "--exit-order"));

	r = run({"-V"});
	assert(r.code == 0);
	assert(r.out.substr(0, 8) == "ctvpool ");
}

void test_bad_arguments() {
	auto chain = std::make_shared<Chain>();
	auto r = run({"--bogus"}, chain);
	assert(r.code == 1);
	assert(has(r.err, "unrecognized option: --bogus"));
	assert(has(r.err, "Usage:"));

	r = run({"--users=2"}, chain);
	assert(r.code == 1);
	assert(has(r.err, "at least 3 users"));

	r = run({"--amount-per-user=1000000000000000"}, chain);
	assert(r.code == 1);
	assert(has(r.err, "exceeds the money supply"));

	r = run({"--users=three"}, chain);
	assert(r.code == 1);
	assert(has(r.err, "--users: not a number"));

	r = run({"--network=moon"}, chain);
	assert(r.code == 1);

	r = run({"--dry-run"}, chain);
	assert(r.code == 1);
	assert(has(r.err, "--withdraw-addrs"));

	r = run({"--exit-order=0,0,1"}, chain);
	assert(r.code == 1);
	assert(has(r.err, "repeated"));

	r = run({"--exit-order=0,1,3"}, chain);
	assert(r.code == 1);

	r = run({"--withdraw-addrs=" + regtest_addr(1)}, chain);
	assert(r.code == 1);

	/* Mainnet address on regtest.  */
	r = run({ "--withdraw-addrs="
		  "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4,"
		+ regtest_addr(2) + "," + regtest_addr(3)
		}, chain);
	assert(r.code == 1);
	assert(has(r.err, "invalid regtest address"));

	/* None of those got as far as the node.  */
	assert(chain->opened == 0);
}

void test_dry_run() {
	auto chain = std::make_shared<Chain>();
	auto r = run({ "--dry-run"
		     , "--withdraw-addrs=" + regtest_addr(1) + ","
					   + regtest_addr(2) + ","
					   + regtest_addr(3)
		     }, chain);
	assert(r.code == 0);
	assert(chain->opened == 0);
	assert(has(r.out, "network: regtest"));
	assert(has(r.out, "users: 3"));
	assert(has(r.out, "total: 300000sat"));
	assert(has(r.out, "nodes: 4"));
	assert(has(r.out, "root: bcrt1p"));
	assert(has(r.out, "root scriptPubKey: 5120"));
	assert(has(r.out, "exit 0: "));
	assert(has(r.out, "exit 2: "));
	assert(has(r.err, "Built 4 taproot nodes"));

	/* Same inputs, same pool.  */
	auto again = run({ "--dry-run"
			 , "--withdraw-addrs=" + regtest_addr(1) + ","
					       + regtest_addr(2) + ","
					       + regtest_addr(3)
			 });
	assert(again.out == r.out);
}

void test_full_run() {
	auto chain = std::make_shared<Chain>();
	auto r = run({ "--users=4"
		     , "--exit-order=2,0,3"
		     , "--rpc-url=http://node:18443/"
		     }, chain);
	assert(r.code == 0);
	assert(chain->opened == 1);
	assert(chain->url == "http://node:18443/");
	assert(chain->addresses == 4);
	assert(chain->funded_amount == Bitcoin::Amount::sat(400000));
	assert(chain->funded_address.substr(0, 6) == "bcrt1p");
	/* 101 to bootstrap, then one per transaction.  */
	assert(chain->blocks == 101 + 1 + 3);

	assert(chain->sent.size() == 3);
	/* The pool output was vout 1 of the funding.  */
	assert(chain->sent[0].inputs[0].prevout.vout == 1);
	auto const expect = std::vector<std::uint8_t>{2, 0, 3};
	for (auto i = std::size_t(0); i < 3; ++i) {
		auto const& tx = chain->sent[i];
		auto want = Bitcoin::addr_to_scriptPubKey(
			regtest_addr(std::uint8_t(expect[i] + 1))
		);
		assert(tx.outputs[0].scriptPubKey == want);
		if (i > 0) {
			assert(tx.inputs[0].prevout.txid == chain->sent[i - 1].txid());
			assert(tx.inputs[0].prevout.vout == 2);
		}
	}
	/* User 1 never named, and gets the rest.  */
	assert( chain->sent[2].outputs[2].scriptPubKey
	     == Bitcoin::addr_to_scriptPubKey(regtest_addr(2))
	      );
	assert(has(r.err, "Step 3: user 3 exits"));
	assert(has(r.err, "All 4 users paid out."));

	/* Funded wallets are not topped up.  */
	auto rich = std::make_shared<Chain>();
	rich->blocks = 200;
	r = run({}, rich);
	assert(r.code == 0);
	assert(rich->blocks == 200 + 1 + 2);
}

void test_bad_funding() {
	auto chain = std::make_shared<Chain>();
	chain->shortchange = true;
	auto r = run({}, chain);
	assert(r.code == 1);
	assert(has(r.err, "does not pay the pool"));
	assert(chain->sent.empty());
}

}

int main() {
	test_help_version();
	test_bad_arguments();
	test_dry_run();
	test_full_run();
	test_bad_funding();
	return 0;
}
