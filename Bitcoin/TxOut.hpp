#ifndef BITCOIN_TXOUT_HPP
#define BITCOIN_TXOUT_HPP

#include"Bitcoin/Amount.hpp"
#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin {

struct TxOut {
	Bitcoin::Amount amount;
	std::vector<std::uint8_t> scriptPubKey;

	bool operator==(TxOut const& o) const {
		return amount == o.amount && scriptPubKey == o.scriptPubKey;
	}
	bool operator!=(TxOut const& o) const { return !(*this == o); }
};

/* Amount then scriptPubKey, exactly as in a
 * transaction, which is also what template
 * hashing feeds into its outputs digest.  */
std::ostream& operator<<(std::ostream&, TxOut const&);
std::istream& operator>>(std::istream&, TxOut&);

}

#endif /* !defined(BITCOIN_TXOUT_HPP) */
