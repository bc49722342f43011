#ifndef BITCOIN_NETWORK_HPP
#define BITCOIN_NETWORK_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Bitcoin {

enum class Network {
	Mainnet,
	Testnet,
	Testnet4,
	Signet,
	Regtest
};

struct UnknownNetwork : public Util::BacktraceException<std::invalid_argument> {
	UnknownNetwork(std::string const& name)
		: Util::BacktraceException<std::invalid_argument>(
			"Unknown network: " + name
		  ) { }
};

/* Accepts the names bitcoind uses for `-chain`,
 * plus `mainnet` and `testnet`.  */
Network network_from_string(std::string const&);
std::string to_string(Network);

/* Segwit human-readable part.  */
std::string bech32_hrp(Network);
/* The port bitcoind listens for RPC on by default.  */
std::uint16_t default_rpc_port(Network);

}

#endif /* !defined(BITCOIN_NETWORK_HPP) */
