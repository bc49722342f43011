#include"Bitcoin/Amount.hpp"
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Ev/Io.hpp"
#include"Pool/Bitcoind.hpp"
#include"Pool/Rpc.hpp"
#include"Pool/open_bitcoind.hpp"
#include"Util/make_unique.hpp"

namespace {

/* Keeps the RPC client alive as long as the
 * node wrapping it.  */
class OwningBitcoind : public Pool::NodeIF {
private:
	Pool::Rpc rpc;
	Pool::Bitcoind bitcoind;

public:
	OwningBitcoind( Ev::ThreadPool& threadpool
		      , Bitcoin::Network network
		      , std::string const& url
		      , std::string const& user
		      , std::string const& password
		      ) : rpc(threadpool, url, user, password)
			, bitcoind(rpc, network)
			{ }

	Ev::Io<Bitcoin::TxId>
	fund(std::string const& address, Bitcoin::Amount amount) override {
		return bitcoind.fund(address, amount);
	}
	Ev::Io<Bitcoin::TxId>
	broadcast(Bitcoin::Tx const& tx) override {
		return bitcoind.broadcast(tx);
	}
	Ev::Io<std::vector<Bitcoin::TxOut>>
	lookup_outputs(Bitcoin::TxId const& txid) override {
		return bitcoind.lookup_outputs(txid);
	}
	Ev::Io<std::string> new_address() override {
		return bitcoind.new_address();
	}
	Ev::Io<Bitcoin::Amount> get_balance() override {
		return bitcoind.get_balance();
	}
	Ev::Io<void> generate(std::size_t blocks) override {
		return bitcoind.generate(blocks);
	}
};

}

namespace Pool {

std::unique_ptr<NodeIF>
open_bitcoind( Ev::ThreadPool& threadpool
	     , Bitcoin::Network network
	     , std::string const& url
	     , std::string const& user
	     , std::string const& password
	     ) {
	return Util::make_unique<OwningBitcoind>(
		threadpool, network, url, user, password
	);
}

}
