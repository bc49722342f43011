#include"Bitcoin/TxOut.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

namespace Bitcoin {

std::ostream& operator<<(std::ostream& os, TxOut const& out) {
	os << le(out.amount);
	write_prefixed(os, out.scriptPubKey);
	return os;
}

std::istream& operator>>(std::istream& is, TxOut& out) {
	is >> le(out.amount);
	read_prefixed(is, out.scriptPubKey);
	return is;
}

}
