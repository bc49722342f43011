#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>
#include<stdexcept>

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 2 * sizeof(d) && Util::Str::ishex(s);
}

Hash::Hash(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Sha256::Hash: need 64 hex digits, got: " + s
		);
	auto bytes = Util::Str::hexread(s);
	from_buffer(bytes.data());
}

Hash::operator std::string() const {
	return Util::Str::hexdump(d, sizeof(d));
}

Hash::operator bool() const {
	return !sodium_is_zero(d, sizeof(d));
}

bool Hash::operator==(Hash const& o) const {
	return sodium_memcmp(d, o.d, sizeof(d)) == 0;
}

}
