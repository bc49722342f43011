#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Pool/Error.hpp"
#include"Pool/Participant.hpp"

namespace Pool {

Participant Participant::make( std::size_t index
			     , std::string address
			     , Bitcoin::Network network
			     ) {
	auto rv = Participant();
	rv.index = index;
	try {
		rv.scriptPubKey = Bitcoin::addr_to_scriptPubKey(address, network);
	} catch (Bitcoin::UnknownAddrType const&) {
		throw ConfigError( "invalid " + Bitcoin::to_string(network)
				 + " address for user "
				 + std::to_string(index) + ": " + address
				 );
	}
	rv.address = std::move(address);
	return rv;
}

std::vector<Participant>
make_participants( std::vector<std::string> const& addresses
		 , Bitcoin::Network network
		 ) {
	auto rv = std::vector<Participant>();
	rv.reserve(addresses.size());
	for (auto i = std::size_t(0); i < addresses.size(); ++i)
		rv.push_back(Participant::make(i, addresses[i], network));
	return rv;
}

}
