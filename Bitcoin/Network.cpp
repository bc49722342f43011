#include"Bitcoin/Network.hpp"

namespace Bitcoin {

Network network_from_string(std::string const& s) {
	if (s == "main" || s == "mainnet" || s == "bitcoin")
		return Network::Mainnet;
	if (s == "test" || s == "testnet")
		return Network::Testnet;
	if (s == "testnet4")
		return Network::Testnet4;
	if (s == "signet")
		return Network::Signet;
	if (s == "regtest")
		return Network::Regtest;
	throw UnknownNetwork(s);
}

std::string to_string(Network n) {
	switch (n) {
	case Network::Mainnet: return "mainnet";
	case Network::Testnet: return "testnet";
	case Network::Testnet4: return "testnet4";
	case Network::Signet: return "signet";
	case Network::Regtest: return "regtest";
	}
	return "unknown";
}

std::string bech32_hrp(Network n) {
	switch (n) {
	case Network::Mainnet: return "bc";
	case Network::Testnet: return "tb";
	case Network::Testnet4: return "tb";
	case Network::Signet: return "tb";
	case Network::Regtest: return "bcrt";
	}
	return "bc";
}

std::uint16_t default_rpc_port(Network n) {
	switch (n) {
	case Network::Mainnet: return 8332;
	case Network::Testnet: return 18332;
	case Network::Testnet4: return 48332;
	case Network::Signet: return 38332;
	case Network::Regtest: return 18443;
	}
	return 8332;
}

}
