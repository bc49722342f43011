#ifndef POOL_NODEIF_HPP
#define POOL_NODEIF_HPP

#include<cstddef>
#include<string>
#include<vector>

namespace Bitcoin { class Amount; }
namespace Bitcoin { class TxId; }
namespace Bitcoin { struct Tx; }
namespace Bitcoin { struct TxOut; }
namespace Ev { template<typename a> class Io; }

namespace Pool {

/** class Pool::NodeIF
 *
 * @brief abstract class representing the Bitcoin
 * node and wallet the pool settles through.
 *
 * @desc Failures are reported as `Pool::NodeError`
 * (or a subclass), and may be retried.
 */
class NodeIF {
public:
	virtual ~NodeIF() { }

	/* Pay `amount` to `address` from the wallet.  */
	virtual
	Ev::Io<Bitcoin::TxId>
	fund(std::string const& address, Bitcoin::Amount amount) =0;

	/* Submit an already-complete transaction.  */
	virtual
	Ev::Io<Bitcoin::TxId>
	broadcast(Bitcoin::Tx const& tx) =0;

	virtual
	Ev::Io<std::vector<Bitcoin::TxOut>>
	lookup_outputs(Bitcoin::TxId const& txid) =0;

	virtual
	Ev::Io<std::string> new_address() =0;

	virtual
	Ev::Io<Bitcoin::Amount> get_balance() =0;

	/* Regtest only.  */
	virtual
	Ev::Io<void> generate(std::size_t blocks) =0;
};

}

#endif /* !defined(POOL_NODEIF_HPP) */
