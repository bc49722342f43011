#ifndef BITCOIN_TXID_HPP
#define BITCOIN_TXID_HPP

#include"Sha256/Hash.hpp"
#include<iostream>
#include<string>

namespace Bitcoin {

/** class Bitcoin::TxId
 *
 * @brief the double-SHA256 of a transaction
 * serialized without witnesses.
 *
 * @desc Held in the byte order the hash comes
 * out in, which is also how it goes on the wire
 * in an outpoint.  The hex form used by bitcoind
 * and block explorers is byte-reversed.
 */
class TxId {
private:
	Sha256::Hash digest;

public:
	TxId() =default;

	/* From the double-SHA256 as computed.  */
	explicit
	TxId(Sha256::Hash digest_) : digest(std::move(digest_)) { }
	/* From the reversed hex form.  */
	explicit
	TxId(std::string const& hex);
	/* To the reversed hex form.  */
	explicit
	operator std::string() const;

	Sha256::Hash const& wire_digest() const { return digest; }

	bool operator==(TxId const& o) const { return digest == o.digest; }
	bool operator!=(TxId const& o) const { return digest != o.digest; }
	bool operator<(TxId const& o) const { return digest < o.digest; }
};

/* Raw 32 bytes, wire order.  */
std::ostream& operator<<(std::ostream&, TxId const&);
std::istream& operator>>(std::istream&, TxId&);

}

#endif /* !defined(BITCOIN_TXID_HPP) */
