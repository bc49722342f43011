#ifndef SECP256K1_TAGGED_HASHES_HPP
#define SECP256K1_TAGGED_HASHES_HPP

#include<cstddef>
#include<cstdint>
#include<vector>

namespace Sha256 { class Hash; }

namespace Tag {

/* The BIP-341 tags used to build taproot outputs.  */
enum tap : std::uint8_t { LEAF, BRANCH, TWEAK };
const char* str(tap);

}

namespace Secp256k1 {

void tagged_hash( std::uint8_t output[32]
		, std::uint8_t const input[]
		, std::size_t size
		, Tag::tap
		);
Sha256::Hash tagged_hash(Tag::tap, std::vector<std::uint8_t> const&);

}

#endif /* !defined(SECP256K1_TAGGED_HASHES_HPP) */
