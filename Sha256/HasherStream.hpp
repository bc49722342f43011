#ifndef SHA256_HASHERSTREAM_HPP
#define SHA256_HASHERSTREAM_HPP

#include"Sha256/Hasher.hpp"
#include<ostream>
#include<streambuf>
#include<string>

namespace Sha256 { class Hash; }

namespace Sha256 {

namespace Detail {

/* Unbuffered: every byte written goes straight
 * into the hasher.  */
class HashingBuf : public std::streambuf {
protected:
	Sha256::Hasher hasher;

	explicit
	HashingBuf(Sha256::Hasher h) : hasher(std::move(h)) { }

	int_type overflow(int_type ch) override;
	std::streamsize xsputn(char const* s, std::streamsize n) override;
};

}

/** class Sha256::HasherStream
 *
 * @brief an `std::ostream` whose output is
 * hashed, so serializers written for streams
 * can compute digests directly.
 *
 * @desc Given a tag, hashes as a BIP-340
 * tagged hash with that tag.
 */
class HasherStream : private Detail::HashingBuf, public std::ostream {
public:
	HasherStream()
		: Detail::HashingBuf(Sha256::Hasher())
		, std::ostream(static_cast<std::streambuf*>(this))
		{ }
	explicit
	HasherStream(std::string const& tag)
		: Detail::HashingBuf(Sha256::Hasher::tagged(tag))
		, std::ostream(static_cast<std::streambuf*>(this))
		{ }
	HasherStream(HasherStream const&) =delete;
	HasherStream(HasherStream&&) =delete;

	Hash finalize()&&;
	Hash get_hash() const;
};

}

#endif /* !defined(SHA256_HASHERSTREAM_HPP) */
