#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include<cstddef>
#include<sodium/crypto_hash_sha256.h>
#include<string>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief incremental SHA256 over libsodium.
 *
 * @desc Copying duplicates the midstate, so a
 * common prefix can be hashed once and then
 * extended in several directions.
 * After `finalize` the hasher is spent and
 * converts to false.
 */
class Hasher {
private:
	crypto_hash_sha256_state state;
	bool live;

public:
	Hasher();
	Hasher(Hasher const&) =default;
	Hasher& operator=(Hasher const&) =default;
	~Hasher();

	/* BIP-340 tagged hasher: already fed with
	 * sha256(tag) twice.  */
	static
	Hasher tagged(std::string const& tag);

	explicit
	operator bool() const { return live; }
	bool operator!() const { return !live; }

	void feed(void const* p, std::size_t size);

	Sha256::Hash finalize()&&;
	/* Hash of what was fed so far, leaving this
	 * hasher usable.  */
	Sha256::Hash get() const;
};

}

#endif /* !defined(SHA256_HASHER_HPP) */
