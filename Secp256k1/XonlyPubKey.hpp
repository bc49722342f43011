#ifndef SECP256K1_XONLYPUBKEY_HPP
#define SECP256K1_XONLYPUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class XonlyPubKey; }

std::ostream& operator<<(std::ostream&, Secp256k1::XonlyPubKey const&);

namespace Secp256k1 {

/* Thrown in case of being fed an invalid public key.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey() : Util::BacktraceException<std::invalid_argument>("Invalid public key.") { }
};

/** class Secp256k1::XonlyPubKey
 *
 * @brief a BIP-340 x-only public key, i.e. a
 * point with even Y identified by its 32-byte
 * X coordinate.
 */
class XonlyPubKey {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	XonlyPubKey(std::unique_ptr<Impl>);

public:
	/* Get G.  */
	XonlyPubKey();
	/* Load from a 64-digit hex string.  */
	explicit XonlyPubKey(std::string const&);
	explicit operator std::string() const;

	XonlyPubKey(XonlyPubKey const&);
	XonlyPubKey(XonlyPubKey&&);
	~XonlyPubKey();

	XonlyPubKey& operator=(XonlyPubKey const& o) {
		auto tmp = XonlyPubKey(o);
		tmp.pimpl.swap(pimpl);
		return *this;
	}
	XonlyPubKey& operator=(XonlyPubKey&& o) {
		auto tmp = XonlyPubKey(std::move(o));
		tmp.pimpl.swap(pimpl);
		return *this;
	}

	bool operator==(XonlyPubKey const&) const;
	bool operator!=(XonlyPubKey const& o) const {
		return !(*this == o);
	}

	static XonlyPubKey from_buffer(std::uint8_t const buffer[32]);
	void to_buffer(std::uint8_t buffer[32]) const;

	/** Secp256k1::XonlyPubKey::tweak_add
	 *
	 * @brief computes `Q = P + t*G` where `P`
	 * is this key lifted to even Y.
	 *
	 * @desc Returns the x-only form of `Q` and
	 * sets `parity` to 1 if `Q` has odd Y.
	 * Throws `InvalidPubKey` if the tweak is
	 * out of range or `Q` is infinity.
	 */
	XonlyPubKey tweak_add(std::uint8_t const tweak[32], int& parity) const;

	friend std::ostream& ::operator<<(std::ostream&, XonlyPubKey const&);
};

}

#endif /* !defined(SECP256K1_XONLYPUBKEY_HPP) */
