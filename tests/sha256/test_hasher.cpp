#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Sha256/HasherStream.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<cstdint>
#include<string>

namespace {

auto const empty = Sha256::Hash("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
auto const abc = Sha256::Hash("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

/* BIP-340 tagged hash, spelled out.  */
Sha256::Hash manual_tagged(std::string const& tag, std::string const& msg) {
	std::uint8_t th[32];
	Sha256::fun(tag.data(), tag.size()).to_buffer(th);
	auto h = Sha256::Hasher();
	h.feed(th, 32);
	h.feed(th, 32);
	h.feed(msg.data(), msg.size());
	return std::move(h).finalize();
}

}

int main() {
	assert(Sha256::fun("", 0) == empty);
	assert(Sha256::fun("abc", 3) == abc);

	/* Piecewise feeding; get() leaves the hasher usable.  */
	{
		auto h = Sha256::Hasher();
		h.feed("a", 1);
		auto copy = h;
		h.feed("bc", 2);
		assert(h.get() == abc);
		assert(h);
		assert(std::move(h).finalize() == abc);
		assert(!h);

		copy.feed("bc", 2);
		assert(std::move(copy).finalize() == abc);
	}

	/* Double SHA256, as used for txids.  */
	assert( Sha256::fun(Sha256::fun("hello", 5))
	     == Sha256::Hash("9595c9df90075148eb06860365df33584b75bff782a510c6cd4883a419833d50")
	      );

	/* Stream interface, across the 64-byte block
	 * boundary.  */
	{
		auto msg = std::string(200, 'x');
		Sha256::HasherStream s;
		s << msg.substr(0, 63) << msg.substr(63, 2) << msg.substr(65);
		assert(s.get_hash() == Sha256::fun(msg.data(), msg.size()));
		assert(std::move(s).finalize() == Sha256::fun(msg.data(), msg.size()));
	}

	/* Tagged streams.  */
	{
		Sha256::HasherStream s("TapLeaf");
		s << "abc";
		auto h = std::move(s).finalize();
		assert(h == manual_tagged("TapLeaf", "abc"));
		assert(h != abc);
		assert(h != manual_tagged("TapBranch", "abc"));
	}
	{
		Sha256::HasherStream s(std::string("TapTweak"));
		assert(std::move(s).finalize() == manual_tagged("TapTweak", ""));
	}

	return 0;
}
