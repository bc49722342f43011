#include"Bitcoin/Amount.hpp"
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Pool/Bitcoind.hpp"
#include"Pool/Error.hpp"
#include"Pool/Rpc.hpp"
#include"Util/make_unique.hpp"
#include<stdexcept>
#include<string>
#include<vector>

namespace {

Bitcoin::TxId parse_txid(std::string const& method, Jsmn::Object const& res) {
	if (!res.is_string())
		throw Pool::NodeError(method + ": expected a txid string");
	auto s = std::string(res);
	if (!Sha256::Hash::valid_string(s))
		throw Pool::NodeError(method + ": bad txid " + s);
	return Bitcoin::TxId(s);
}

std::string get_string( std::string const& method
		      , Jsmn::Object const& res
		      , std::string const& field
		      ) {
	if (!res.is_object() || !res.has(field) || !res[field].is_string())
		throw Pool::NodeError(method + ": reply lacks " + field);
	return std::string(res[field]);
}

}

namespace Pool {

std::vector<Bitcoin::TxOut> raw_tx_outputs(Jsmn::Object const& reply) {
	if (!reply.is_string())
		throw NodeError("getrawtransaction: expected hex");
	try {
		return Bitcoin::Tx(std::string(reply)).outputs;
	} catch (std::invalid_argument const& e) {
		throw NodeError(std::string("getrawtransaction: ") + e.what());
	}
}

class Bitcoind::Impl {
private:
	Rpc& rpc;
	Bitcoin::Network network;
	/* Fetched on first use.  */
	std::string mining_address;

public:
	Impl(Rpc& rpc_, Bitcoin::Network network_)
		: rpc(rpc_), network(network_) { }

	Ev::Io<Bitcoin::TxId>
	fund(std::string const& address, Bitcoin::Amount amount) {
		/* An input-less transaction paying the pool,
		 * for the wallet to complete.  */
		auto tx = Bitcoin::Tx();
		auto out = Bitcoin::TxOut();
		out.amount = amount;
		out.scriptPubKey = Bitcoin::addr_to_scriptPubKey(address, network);
		tx.outputs.push_back(std::move(out));

		auto params = Json::Out()
			.start_array()
				.entry(std::string(tx))
				.start_object()
				.end_object()
				/* iswitness: a zero-input transaction
				 * looks like a segwit marker otherwise.  */
				.entry(false)
			.end_array()
			;
		return rpc.command("fundrawtransaction", params).then([this](Jsmn::Object res) {
			auto hex = get_string("fundrawtransaction", res, "hex");
			auto params = Json::Out()
				.start_array()
					.entry(hex)
				.end_array()
				;
			return rpc.command("signrawtransactionwithwallet", params);
		}).then([this](Jsmn::Object res) {
			auto hex = get_string("signrawtransactionwithwallet", res, "hex");
			if (!res.has("complete") || !bool(res["complete"]))
				throw NodeError("signrawtransactionwithwallet: incomplete signatures");
			return send(hex);
		});
	}

	Ev::Io<Bitcoin::TxId> send(std::string const& hex) {
		auto params = Json::Out()
			.start_array()
				.entry(hex)
			.end_array()
			;
		return rpc.command("sendrawtransaction", params).then([](Jsmn::Object res) {
			return Ev::lift(parse_txid("sendrawtransaction", res));
		});
	}

	Ev::Io<std::vector<Bitcoin::TxOut>>
	lookup_outputs(Bitcoin::TxId const& txid) {
		auto params = Json::Out()
			.start_array()
				.entry(std::string(txid))
				.entry(false)
			.end_array()
			;
		return rpc.command("getrawtransaction", params).then([](Jsmn::Object res) {
			return Ev::lift(raw_tx_outputs(res));
		});
	}

	Ev::Io<std::string> new_address() {
		auto params = Json::Out()
			.start_array()
				.entry(std::string(""))
				.entry(std::string("bech32"))
			.end_array()
			;
		return rpc.command("getnewaddress", params).then([](Jsmn::Object res) {
			if (!res.is_string())
				throw NodeError("getnewaddress: expected a string");
			return Ev::lift(std::string(res));
		});
	}

	Ev::Io<Bitcoin::Amount> get_balance() {
		auto params = Json::Out().start_array().end_array();
		return rpc.command("getbalance", params).then([](Jsmn::Object res) {
			if (!res.is_number())
				throw NodeError("getbalance: expected a number");
			return Ev::lift(Bitcoin::Amount::btc(double(res)));
		});
	}

	Ev::Io<void> generate(std::size_t blocks) {
		auto get_addr = Ev::lift(mining_address);
		if (mining_address.empty())
			get_addr = new_address().then([this](std::string a) {
				mining_address = a;
				return Ev::lift(a);
			});
		return get_addr.then([this, blocks](std::string addr) {
			auto params = Json::Out()
				.start_array()
					.entry(std::uint64_t(blocks))
					.entry(addr)
				.end_array()
				;
			return rpc.command("generatetoaddress", params);
		}).then([](Jsmn::Object) {
			return Ev::lift();
		});
	}
};

Bitcoind::Bitcoind(Rpc& rpc, Bitcoin::Network network)
	: pimpl(Util::make_unique<Impl>(rpc, network)) { }
Bitcoind::Bitcoind(Bitcoind&&) =default;
Bitcoind::~Bitcoind() =default;

Ev::Io<Bitcoin::TxId>
Bitcoind::fund(std::string const& address, Bitcoin::Amount amount) {
	return pimpl->fund(address, amount);
}
Ev::Io<Bitcoin::TxId>
Bitcoind::broadcast(Bitcoin::Tx const& tx) {
	return pimpl->send(std::string(tx));
}
Ev::Io<std::vector<Bitcoin::TxOut>>
Bitcoind::lookup_outputs(Bitcoin::TxId const& txid) {
	return pimpl->lookup_outputs(txid);
}
Ev::Io<std::string> Bitcoind::new_address() {
	return pimpl->new_address();
}
Ev::Io<Bitcoin::Amount> Bitcoind::get_balance() {
	return pimpl->get_balance();
}
Ev::Io<void> Bitcoind::generate(std::size_t blocks) {
	return pimpl->generate(blocks);
}

}
