#ifndef BITCOIN_OUTPOINT_HPP
#define BITCOIN_OUTPOINT_HPP

#include"Bitcoin/TxId.hpp"
#include<cstdint>
#include<ostream>
#include<string>

namespace Bitcoin {

/** struct Bitcoin::OutPoint
 *
 * @brief a reference to a particular output
 * of a particular transaction.
 */
struct OutPoint {
	Bitcoin::TxId txid;
	std::uint32_t vout;

	OutPoint() : vout(0) { }
	OutPoint(Bitcoin::TxId txid_, std::uint32_t vout_)
		: txid(std::move(txid_)), vout(vout_) { }

	bool operator==(OutPoint const& o) const {
		return txid == o.txid && vout == o.vout;
	}
	bool operator!=(OutPoint const& o) const {
		return !(*this == o);
	}
};

/* `txid:vout`, the form used in logs.  */
inline
std::ostream& operator<<(std::ostream& os, OutPoint const& o) {
	return os << std::string(o.txid) << ":" << o.vout;
}

}

#endif /* !defined(BITCOIN_OUTPOINT_HPP) */
