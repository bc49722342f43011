#ifndef BITCOIN_ADDR_TO_SCRIPTPUBKEY_HPP
#define BITCOIN_ADDR_TO_SCRIPTPUBKEY_HPP

#include"Bitcoin/Network.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<string>
#include<stdexcept>
#include<vector>

namespace Bitcoin {

struct UnknownAddrType : public Util::BacktraceException<std::invalid_argument> {
public:
	UnknownAddrType()
		: Util::BacktraceException<std::invalid_argument>("Bitcoin::UnknownAddrType") { }
};

/** Bitcoin::addr_to_scriptPubKey
 *
 * @brief given a segwit address, returns the
 * `scriptPubKey` it should have, or throws
 * `Bitcoin::UnknownAddrType` if the address
 * fails to validate.
 *
 * @desc The checksum is validated: version 0
 * programs must use bech32 and version 1 and
 * above must use bech32m.
 * Addresses typed in by users come through
 * here, so a single mistyped character must
 * be caught.
 *
 * The overload taking a network also rejects
 * addresses for other networks.
 */
std::vector<std::uint8_t>
addr_to_scriptPubKey(std::string const&);
std::vector<std::uint8_t>
addr_to_scriptPubKey(std::string const&, Bitcoin::Network);

}

#endif /* !defined(BITCOIN_ADDR_TO_SCRIPTPUBKEY_HPP) */
