#ifndef BITCOIN_TX_HPP
#define BITCOIN_TX_HPP

#include"Bitcoin/TxIn.hpp"
#include"Bitcoin/TxOut.hpp"
#include<cstdint>
#include<iostream>
#include<string>
#include<vector>

namespace Bitcoin { class TxId; }

namespace Bitcoin {

/** struct Bitcoin::Tx
 *
 * @brief a whole transaction.
 *
 * @desc Serializes in the segwit form (marker,
 * flag, witnesses after the outputs) when any
 * input has a witness, and in the legacy form
 * otherwise.  That is also how it parses, so
 * an input-less transaction does not survive a
 * round trip: its zero input count reads as the
 * segwit marker.
 */
struct Tx {
	std::uint32_t version;
	std::vector<TxIn> inputs;
	std::vector<TxOut> outputs;
	std::uint32_t locktime;

	Tx() : version(2), locktime(0) { }

	/* Throws std::invalid_argument on bad hex,
	 * truncation or trailing bytes.  */
	explicit
	Tx(std::string const& hex);
	explicit
	operator std::string() const;

	Bitcoin::TxId txid() const;
};

std::ostream& operator<<(std::ostream&, Tx const&);
std::istream& operator>>(std::istream&, Tx&);

}

#endif /* !defined(BITCOIN_TX_HPP) */
