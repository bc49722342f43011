#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Util/Bech32.hpp"

namespace Bitcoin {

std::string
scriptPubKey_to_addr( std::vector<std::uint8_t> const& spk
		    , Bitcoin::Network network
		    ) {
	/* OP_n <push of 2..40 bytes>  */
	if (spk.size() < 4 || spk.size() > 42)
		throw UnknownAddrType();
	auto op = spk[0];
	auto version = std::uint8_t();
	if (op == 0x00)
		version = 0;
	else if (0x51 <= op && op <= 0x60)
		version = op - 0x50;
	else
		throw UnknownAddrType();
	if (std::size_t(spk[1]) + 2 != spk.size())
		throw UnknownAddrType();
	if (version == 0 && spk[1] != 20 && spk[1] != 32)
		throw UnknownAddrType();

	auto data = std::vector<std::uint8_t>();
	data.push_back(version);
	auto program = std::vector<std::uint8_t>(spk.begin() + 2, spk.end());
	Util::Bech32::convert_bits(data, program, 8, 5, true);

	auto encoding = version == 0 ? Util::Bech32::Encoding::Bech32
				     : Util::Bech32::Encoding::Bech32m
				     ;
	return Util::Bech32::encode(bech32_hrp(network), data, encoding);
}

}
