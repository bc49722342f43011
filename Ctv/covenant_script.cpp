#include"Ctv/covenant_script.hpp"
#include"Sha256/Hash.hpp"

namespace {

auto constexpr OP_PUSHBYTES_32 = std::uint8_t(0x20);
auto constexpr OP_CHECKTEMPLATEVERIFY = std::uint8_t(0xb3);
auto constexpr OP_DROP = std::uint8_t(0x75);
auto constexpr OP_TRUE = std::uint8_t(0x51);

auto constexpr script_size = std::size_t(1 + 32 + 3);

}

namespace Ctv {

std::vector<std::uint8_t> covenant_script(Sha256::Hash const& commitment) {
	auto rv = std::vector<std::uint8_t>(script_size);
	rv[0] = OP_PUSHBYTES_32;
	commitment.to_buffer(&rv[1]);
	rv[33] = OP_CHECKTEMPLATEVERIFY;
	rv[34] = OP_DROP;
	rv[35] = OP_TRUE;
	return rv;
}

Sha256::Hash covenant_commitment(std::vector<std::uint8_t> const& script) {
	if ( script.size() != script_size
	  || script[0] != OP_PUSHBYTES_32
	  || script[33] != OP_CHECKTEMPLATEVERIFY
	  || script[34] != OP_DROP
	  || script[35] != OP_TRUE
	   )
		throw NotCovenantScript();
	auto rv = Sha256::Hash();
	rv.from_buffer(&script[1]);
	return rv;
}

}
