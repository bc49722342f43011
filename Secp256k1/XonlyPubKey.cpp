#include<secp256k1.h>
#include<secp256k1_extrakeys.h>
#include<sodium/utils.h>
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

using Secp256k1::Detail::context;

namespace {

std::uint8_t const G_x[32] =
{ 0x79, 0xbe, 0x66, 0x7e, 0xf9, 0xdc, 0xbb, 0xac
, 0x55, 0xa0, 0x62, 0x95, 0xce, 0x87, 0x0b, 0x07
, 0x02, 0x9b, 0xfc, 0xdb, 0x2d, 0xce, 0x28, 0xd9
, 0x59, 0xf2, 0x81, 0x5b, 0x16, 0xf8, 0x17, 0x98
};

}

namespace Secp256k1 {

class XonlyPubKey::Impl {
public:
	secp256k1_xonly_pubkey key;

	explicit Impl(std::uint8_t const buffer[32]) {
		auto res = secp256k1_xonly_pubkey_parse( context()
						       , &key
						       , buffer
						       );
		if (!res)
			throw InvalidPubKey();
	}
	Impl() { }
	Impl(Impl const&) =default;

	void to_buffer(std::uint8_t buffer[32]) const {
		/* Serializing a parsed key cannot fail.  */
		secp256k1_xonly_pubkey_serialize(context(), buffer, &key);
	}

	bool equal(Impl const& o) const {
		std::uint8_t a[32];
		std::uint8_t b[32];
		to_buffer(a);
		o.to_buffer(b);
		return sodium_memcmp(a, b, sizeof(a)) == 0;
	}

	std::unique_ptr<Impl>
	tweak_add(std::uint8_t const tweak[32], int& parity) const {
		secp256k1_pubkey full;
		auto res = secp256k1_xonly_pubkey_tweak_add( context()
							   , &full
							   , &key
							   , tweak
							   );
		if (!res)
			throw InvalidPubKey();

		auto rv = Util::make_unique<Impl>();
		res = secp256k1_xonly_pubkey_from_pubkey( context()
							, &rv->key
							, &parity
							, &full
							);
		if (!res)
			throw InvalidPubKey();
		return rv;
	}
};

XonlyPubKey::XonlyPubKey(std::unique_ptr<Impl> pimpl_)
	: pimpl(std::move(pimpl_)) { }

XonlyPubKey::XonlyPubKey()
	: pimpl(Util::make_unique<Impl>(G_x)) { }

XonlyPubKey::XonlyPubKey(std::string const& s) {
	auto buf = Util::Str::hexread(s);
	if (buf.size() != 32)
		throw InvalidPubKey();
	pimpl = Util::make_unique<Impl>(&buf[0]);
}
XonlyPubKey::operator std::string() const {
	std::uint8_t buf[32];
	pimpl->to_buffer(buf);
	return Util::Str::hexdump(buf, sizeof(buf));
}

XonlyPubKey::XonlyPubKey(XonlyPubKey const& o)
	: pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
XonlyPubKey::XonlyPubKey(XonlyPubKey&& o) {
	/* Leave the moved-from object valid.  */
	auto mine = Util::make_unique<Impl>(*o.pimpl);
	std::swap(pimpl, mine);
}
XonlyPubKey::~XonlyPubKey() { }

bool XonlyPubKey::operator==(XonlyPubKey const& o) const {
	return pimpl->equal(*o.pimpl);
}

XonlyPubKey XonlyPubKey::from_buffer(std::uint8_t const buffer[32]) {
	return XonlyPubKey(Util::make_unique<Impl>(buffer));
}
void XonlyPubKey::to_buffer(std::uint8_t buffer[32]) const {
	pimpl->to_buffer(buffer);
}

XonlyPubKey
XonlyPubKey::tweak_add(std::uint8_t const tweak[32], int& parity) const {
	return XonlyPubKey(pimpl->tweak_add(tweak, parity));
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::XonlyPubKey const& pk) {
	return os << std::string(pk);
}
