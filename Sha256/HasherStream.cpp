#include"Sha256/Hash.hpp"
#include"Sha256/HasherStream.hpp"

namespace Sha256 {

namespace Detail {

HashingBuf::int_type HashingBuf::overflow(int_type ch) {
	if (traits_type::eq_int_type(ch, traits_type::eof()))
		return traits_type::not_eof(ch);
	auto c = traits_type::to_char_type(ch);
	hasher.feed(&c, 1);
	return ch;
}

std::streamsize HashingBuf::xsputn(char const* s, std::streamsize n) {
	hasher.feed(s, std::size_t(n));
	return n;
}

}

Hash HasherStream::finalize()&& {
	return std::move(hasher).finalize();
}
Hash HasherStream::get_hash() const {
	return hasher.get();
}

}
