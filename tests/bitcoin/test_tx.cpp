#undef NDEBUG
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

namespace {

/* A mainnet P2SH-P2WPKH spend.  */
auto const segwit_hex = std::string("02000000000101385e378e72018e7e902980145fdbbfd16e6b0526bb63c656d5c1af3e63a6292e000000001716001471b2a7fc4fd6d6f4ee0d80db24a7bee788ba6442feffffff02636a9902000000001976a9143b9cdf5afe5640861cb96cdb3af5eca4216e303388ac431663720000000017a91471c7ff853df638d8bc076ba0841dcc30749ed74f870247304402204e4c50c34727caf658ecf0455d67d320078a5861e7bbe1fd207bbd720a40f7bd0220234067858406eb86cec3b0ff1d10612dc2bfc1a1d63782aeb0d9aea688d2c7f20121027ee675512d19023e72ba3c75ba5738e0e56979d6916da9bba8ddf4cc331942d0eae80900");
auto const segwit_txid = Bitcoin::TxId("31e394b1c76d6162b95487e6719a0d4a4b585a0a22c96980978a5c6ee2c06197");

}

int main() {
	/* Parse, inspect, re-serialize.  */
	{
		auto tx = Bitcoin::Tx(segwit_hex);
		assert(tx.txid() == segwit_txid);
		assert(std::string(tx) == segwit_hex);

		assert(tx.version == 2);
		assert(tx.inputs.size() == 1);
		assert(tx.inputs[0].prevout.txid == Bitcoin::TxId("2e29a6633eafc1d556c663bb26056b6ed1bfdb5f148029907e8e01728e375e38"));
		assert(tx.inputs[0].prevout.vout == 0);
		assert(tx.inputs[0].script_sig == Util::Str::hexread("16001471b2a7fc4fd6d6f4ee0d80db24a7bee788ba6442"));
		assert(tx.inputs[0].witness.size() == 2);
		assert(tx.inputs[0].witness[1] == Util::Str::hexread("027ee675512d19023e72ba3c75ba5738e0e56979d6916da9bba8ddf4cc331942d0"));
		assert(tx.inputs[0].sequence == 0xfffffffe);
		assert(tx.outputs.size() == 2);
		assert(tx.outputs[0].amount == Bitcoin::Amount::sat(43608675));
		assert(tx.outputs[1].amount == Bitcoin::Amount::sat(1919096387));
		assert(tx.outputs[1].scriptPubKey == Util::Str::hexread("a91471c7ff853df638d8bc076ba0841dcc30749ed74f87"));
		assert(tx.locktime == 649450);

		/* The witness does not affect the txid.  */
		auto stripped = tx;
		stripped.inputs[0].witness.clear();
		assert(stripped.txid() == segwit_txid);
		assert(std::string(stripped).size() < segwit_hex.size());
	}

	/* The shape of a pool exit: one script-path input,
	 * three outputs.  */
	{
		auto tx = Bitcoin::Tx();
		auto in = Bitcoin::TxIn();
		in.prevout.txid = segwit_txid;
		in.prevout.vout = 2;
		in.sequence = 0xfffffffd;
		in.witness.push_back(Util::Str::hexread("20" + std::string(64, 'a') + "b37551"));
		in.witness.push_back(Util::Str::hexread("c1" + std::string(64, 'b')));
		tx.inputs.push_back(in);
		for (auto spk : { "51024e73", "5120" "0000000000000000000000000000000000000000000000000000000000000001" }) {
			auto out = Bitcoin::TxOut();
			out.amount = Bitcoin::Amount::sat(1000);
			out.scriptPubKey = Util::Str::hexread(spk);
			tx.outputs.push_back(out);
		}

		auto hex = std::string(tx);
		/* Version, then the segwit marker and flag.  */
		assert(hex.substr(0, 12) == "020000000001");
		auto back = Bitcoin::Tx(hex);
		assert(back.inputs == tx.inputs);
		assert(back.outputs == tx.outputs);
		assert(back.txid() == tx.txid());
		assert(std::string(back) == hex);
	}

	/* No inputs: written in the legacy form, which is
	 * what a wallet is asked to fund.  */
	{
		auto tx = Bitcoin::Tx();
		auto out = Bitcoin::TxOut();
		out.amount = Bitcoin::Amount::sat(100000);
		out.scriptPubKey = Util::Str::hexread("51024e73");
		tx.outputs.push_back(out);
		assert(std::string(tx) == "02000000" "00" "01" "a086010000000000" "04" "51024e73" "00000000");
	}

	/* Junk is rejected.  */
	{
		auto caught = 0;
		try {
			Bitcoin::Tx(segwit_hex.substr(0, 40));
		} catch (std::invalid_argument const&) {
			++caught;
		}
		try {
			Bitcoin::Tx(segwit_hex + "00");
		} catch (std::invalid_argument const&) {
			++caught;
		}
		assert(caught == 2);
	}

	return 0;
}
