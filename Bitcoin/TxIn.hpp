#ifndef BITCOIN_TXIN_HPP
#define BITCOIN_TXIN_HPP

#include"Bitcoin/OutPoint.hpp"
#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin {

/* Witness stack of one input, bottom first.  For
 * a tapscript spend the last two items are the
 * script and the control block.  */
typedef std::vector<std::vector<std::uint8_t>> Witness;

/** struct Bitcoin::TxIn
 *
 * @brief one transaction input.
 *
 * @desc The stream operators cover the outpoint,
 * scriptSig and sequence only.  The witness is
 * written separately, after all outputs, by
 * `Bitcoin::Tx`.
 */
struct TxIn {
	Bitcoin::OutPoint prevout;
	std::vector<std::uint8_t> script_sig;
	std::uint32_t sequence;
	Bitcoin::Witness witness;

	TxIn() : sequence(0xFFFFFFFF) { }

	bool operator==(TxIn const& o) const {
		return prevout == o.prevout
		    && script_sig == o.script_sig
		    && sequence == o.sequence
		    && witness == o.witness
		     ;
	}
	bool operator!=(TxIn const& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream&, TxIn const&);
std::istream& operator>>(std::istream&, TxIn&);

}

#endif /* !defined(BITCOIN_TXIN_HPP) */
