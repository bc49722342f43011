#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<cstddef>
#include<cstdint>
#include<cstring>
#include<functional>
#include<iostream>
#include<string>

namespace Sha256 { class Hasher; }

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte digest, by value.
 *
 * @desc Starts out all zeroes, which also
 * serves as "no hash" through `operator bool`.
 */
class Hash {
private:
	std::uint8_t d[32];

	explicit
	Hash(std::uint8_t const bytes[32]) {
		std::memcpy(d, bytes, sizeof(d));
	}

	friend class Sha256::Hasher;

public:
	Hash() { std::memset(d, 0, sizeof(d)); }

	static
	bool valid_string(std::string const&);
	/* 64 hex digits, in byte order.  */
	explicit
	Hash(std::string const&);
	explicit
	operator std::string() const;

	explicit
	operator bool() const;
	bool operator!() const { return !bool(*this); }

	/* Constant-time.  */
	bool operator==(Hash const&) const;
	bool operator!=(Hash const& o) const { return !(*this == o); }
	/* Bytewise, as BIP-341 sorts branch children.  */
	bool operator<(Hash const& o) const {
		return std::memcmp(d, o.d, sizeof(d)) < 0;
	}

	void to_buffer(std::uint8_t out[32]) const {
		std::memcpy(out, d, sizeof(d));
	}
	void from_buffer(std::uint8_t const in[32]) {
		std::memcpy(d, in, sizeof(d));
	}
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& h) {
	return os << std::string(h);
}

}

namespace std {
template<>
struct hash<::Sha256::Hash> {
	std::size_t operator()(::Sha256::Hash const& h) const {
		/* Already uniform; a prefix will do.  */
		std::uint8_t b[32];
		h.to_buffer(b);
		auto rv = std::size_t();
		std::memcpy(&rv, b, sizeof(rv));
		return rv;
	}
};
}

#endif /* !defined(SHA256_HASH_HPP) */
