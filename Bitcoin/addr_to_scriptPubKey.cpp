#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Util/Bech32.hpp"

namespace {

std::vector<std::uint8_t>
decode(std::string& hrp, std::string const& addr) {
	using Util::Bech32::Encoding;

	auto data = std::vector<std::uint8_t>();
	auto encoding = Util::Bech32::decode(hrp, data, addr);
	if (encoding == Encoding::Invalid)
		throw Bitcoin::UnknownAddrType();

	if (hrp != "bc" && hrp != "tb" && hrp != "bcrt")
		throw Bitcoin::UnknownAddrType();

	if (data.empty())
		throw Bitcoin::UnknownAddrType();
	auto segwit_version = data[0];
	if (segwit_version > 16)
		throw Bitcoin::UnknownAddrType();

	/* BIP-350.  */
	if (segwit_version == 0 && encoding != Encoding::Bech32)
		throw Bitcoin::UnknownAddrType();
	if (segwit_version != 0 && encoding != Encoding::Bech32m)
		throw Bitcoin::UnknownAddrType();

	auto program = std::vector<std::uint8_t>();
	auto five = std::vector<std::uint8_t>(data.begin() + 1, data.end());
	if (!Util::Bech32::convert_bits(program, five, 5, 8, false))
		throw Bitcoin::UnknownAddrType();

	/* From 2 to 40 bytes as per BIP-173.  */
	if (program.size() < 2 || program.size() > 40)
		throw Bitcoin::UnknownAddrType();
	if ( segwit_version == 0
	  && program.size() != 20
	  && program.size() != 32
	   )
		throw Bitcoin::UnknownAddrType();

	auto rv = std::vector<std::uint8_t>();
	rv.push_back(segwit_version == 0 ? 0x00
					 : (0x50 + segwit_version)
					 );
	rv.push_back(std::uint8_t(program.size()));
	rv.insert(rv.end(), program.begin(), program.end());
	return rv;
}

}

namespace Bitcoin {

std::vector<std::uint8_t>
addr_to_scriptPubKey(std::string const& addr) {
	auto hrp = std::string();
	return decode(hrp, addr);
}

std::vector<std::uint8_t>
addr_to_scriptPubKey(std::string const& addr, Bitcoin::Network network) {
	auto hrp = std::string();
	auto rv = decode(hrp, addr);
	if (hrp != bech32_hrp(network))
		throw UnknownAddrType();
	return rv;
}

}
