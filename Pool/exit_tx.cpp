#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/Tx.hpp"
#include"Pool/Config.hpp"
#include"Pool/exit_tx.hpp"

namespace Pool {

Bitcoin::Tx exit_tx( Pool::Config const& config
		   , Bitcoin::Amount value
		   , std::vector<std::uint8_t> const& exiter_spk
		   , std::vector<std::uint8_t> const& rest_spk
		   , Bitcoin::OutPoint const& prevout
		   ) {
	auto tx = Bitcoin::Tx();
	tx.version = config.tx_version;
	tx.locktime = config.lock_time;

	auto in = Bitcoin::TxIn();
	in.prevout = prevout;
	in.sequence = config.sequence;
	tx.inputs.push_back(std::move(in));

	auto out = Bitcoin::TxOut();
	out.amount = config.payout();
	out.scriptPubKey = exiter_spk;
	tx.outputs.push_back(out);

	out.amount = config.fee;
	out.scriptPubKey = config.fee_anchor_spk;
	tx.outputs.push_back(out);

	/* value - payout - fee, and the fee itself is
	 * left unclaimed for the miner.  */
	out.amount = value - config.payout() - config.fee - config.fee;
	out.scriptPubKey = rest_spk;
	tx.outputs.push_back(out);

	return tx;
}

}
