#ifndef POOL_BITCOIND_HPP
#define POOL_BITCOIND_HPP

#include"Bitcoin/Network.hpp"
#include"Pool/NodeIF.hpp"
#include<memory>
#include<vector>

namespace Jsmn { class Object; }
namespace Pool { class Rpc; }

namespace Pool {

/** class Pool::Bitcoind
 *
 * @brief `Pool::NodeIF` on top of the bitcoind
 * JSON-RPC interface and its loaded wallet.
 */
class Bitcoind : public NodeIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Bitcoind() =delete;
	Bitcoind(Rpc& rpc, Bitcoin::Network network);
	Bitcoind(Bitcoind&&);
	~Bitcoind() override;

	Ev::Io<Bitcoin::TxId>
	fund(std::string const& address, Bitcoin::Amount amount) override;
	Ev::Io<Bitcoin::TxId>
	broadcast(Bitcoin::Tx const& tx) override;
	Ev::Io<std::vector<Bitcoin::TxOut>>
	lookup_outputs(Bitcoin::TxId const& txid) override;
	Ev::Io<std::string> new_address() override;
	Ev::Io<Bitcoin::Amount> get_balance() override;
	Ev::Io<void> generate(std::size_t blocks) override;
};

/* Decodes a `getrawtransaction` reply (non-verbose)
 * into the outputs of the transaction.  A reply
 * that is not a well-formed transaction throws
 * `Pool::NodeError`.  */
std::vector<Bitcoin::TxOut> raw_tx_outputs(Jsmn::Object const& reply);

}

#endif /* !defined(POOL_BITCOIND_HPP) */
