#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include<sodium/utils.h>
#include<stdexcept>

namespace Sha256 {

Hasher::Hasher() : live(true) {
	crypto_hash_sha256_init(&state);
}
Hasher::~Hasher() {
	sodium_memzero(&state, sizeof(state));
}

Hasher Hasher::tagged(std::string const& tag) {
	std::uint8_t t[crypto_hash_sha256_BYTES];
	crypto_hash_sha256( t
			  , reinterpret_cast<unsigned char const*>(tag.data())
			  , tag.size()
			  );
	auto rv = Hasher();
	rv.feed(t, sizeof(t));
	rv.feed(t, sizeof(t));
	return rv;
}

void Hasher::feed(void const* p, std::size_t size) {
	if (!live)
		throw Util::BacktraceException<std::logic_error>(
			"Sha256::Hasher: fed after finalize"
		);
	crypto_hash_sha256_update( &state
				 , static_cast<unsigned char const*>(p)
				 , size
				 );
}

Sha256::Hash Hasher::finalize()&& {
	if (!live)
		throw Util::BacktraceException<std::logic_error>(
			"Sha256::Hasher: finalized twice"
		);
	std::uint8_t d[crypto_hash_sha256_BYTES];
	crypto_hash_sha256_final(&state, d);
	live = false;

	auto rv = Sha256::Hash(d);
	sodium_memzero(d, sizeof(d));
	return rv;
}

Sha256::Hash Hasher::get() const {
	return Hasher(*this).finalize();
}

}
