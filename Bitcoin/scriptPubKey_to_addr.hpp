#ifndef BITCOIN_SCRIPTPUBKEY_TO_ADDR_HPP
#define BITCOIN_SCRIPTPUBKEY_TO_ADDR_HPP

#include"Bitcoin/Network.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Bitcoin {

/** Bitcoin::scriptPubKey_to_addr
 *
 * @brief encodes a segwit `scriptPubKey` as
 * an address for the given network.
 *
 * @desc Throws `Bitcoin::UnknownAddrType` if
 * the script is not a witness program.
 */
std::string
scriptPubKey_to_addr( std::vector<std::uint8_t> const&
		    , Bitcoin::Network
		    );

}

#endif /* !defined(BITCOIN_SCRIPTPUBKEY_TO_ADDR_HPP) */
