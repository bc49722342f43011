#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"
#include"Sha256/HasherStream.hpp"
#include"Sha256/fun.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sstream>
#include<stdexcept>

namespace {

bool has_witness(Bitcoin::Tx const& tx) {
	return std::any_of( tx.inputs.begin(), tx.inputs.end()
			  , [](Bitcoin::TxIn const& in) {
		return !in.witness.empty();
	});
}

void write_body(std::ostream& os, Bitcoin::Tx const& tx) {
	os << Bitcoin::varint(tx.inputs.size());
	for (auto const& in : tx.inputs)
		os << in;
	os << Bitcoin::varint(tx.outputs.size());
	for (auto const& out : tx.outputs)
		os << out;
}

/* One element at a time, so a bogus count runs
 * out of input instead of allocating.  */
template<typename t>
void read_list(std::istream& is, std::vector<t>& items) {
	auto count = std::uint64_t();
	is >> Bitcoin::varint(count);
	items.clear();
	while (is && items.size() < count) {
		items.emplace_back();
		is >> items.back();
	}
}

}

namespace Bitcoin {

std::ostream& operator<<(std::ostream& os, Tx const& tx) {
	auto segwit = has_witness(tx);
	os << le(tx.version);
	if (segwit)
		os.put(0x00).put(0x01);
	write_body(os, tx);
	if (segwit)
		for (auto const& in : tx.inputs) {
			os << varint(in.witness.size());
			for (auto const& item : in.witness)
				write_prefixed(os, item);
		}
	return os << le(tx.locktime);
}

std::istream& operator>>(std::istream& is, Tx& tx) {
	is >> le(tx.version);

	auto segwit = false;
	if (is.peek() == 0x00) {
		is.get();
		if (is.get() != 0x01) {
			is.setstate(std::ios_base::failbit);
			return is;
		}
		segwit = true;
	}
	read_list(is, tx.inputs);
	read_list(is, tx.outputs);

	for (auto& in : tx.inputs) {
		in.witness.clear();
		if (!segwit)
			continue;
		auto count = std::uint64_t();
		is >> varint(count);
		while (is && in.witness.size() < count) {
			in.witness.emplace_back();
			read_prefixed(is, in.witness.back());
		}
	}

	return is >> le(tx.locktime);
}

Tx::Tx(std::string const& hex) {
	if (!Util::Str::ishex(hex))
		throw Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Tx: not a hex string"
		);
	auto raw = Util::Str::hexread(hex);
	auto is = std::istringstream(std::string(raw.begin(), raw.end()));
	is >> *this;
	if (!is)
		throw Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Tx: truncated or malformed transaction"
		);
	if (is.peek() != std::char_traits<char>::eof())
		throw Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Tx: trailing data after transaction"
		);
}

Tx::operator std::string() const {
	auto os = std::ostringstream();
	os << *this;
	auto raw = os.str();
	return Util::Str::hexdump(raw.data(), raw.size());
}

TxId Tx::txid() const {
	auto h = Sha256::HasherStream();
	h << le(version);
	write_body(h, *this);
	h << le(locktime);
	return TxId(Sha256::fun(std::move(h).finalize()));
}

}
