#include"Bitcoin/TxIn.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

namespace Bitcoin {

std::ostream& operator<<(std::ostream& os, TxIn const& in) {
	os << in.prevout.txid << le(in.prevout.vout);
	write_prefixed(os, in.script_sig);
	return os << le(in.sequence);
}

std::istream& operator>>(std::istream& is, TxIn& in) {
	is >> in.prevout.txid >> le(in.prevout.vout);
	read_prefixed(is, in.script_sig);
	return is >> le(in.sequence);
}

}
