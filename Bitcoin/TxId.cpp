#include"Bitcoin/TxId.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<stdexcept>

namespace Bitcoin {

TxId::TxId(std::string const& hex) {
	if (!Sha256::Hash::valid_string(hex))
		throw Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::TxId: need 64 hex digits, got: " + hex
		);
	auto bytes = Util::Str::hexread(hex);
	std::reverse(bytes.begin(), bytes.end());
	digest.from_buffer(bytes.data());
}

TxId::operator std::string() const {
	std::uint8_t bytes[32];
	digest.to_buffer(bytes);
	std::reverse(bytes, bytes + 32);
	return Util::Str::hexdump(bytes, sizeof(bytes));
}

std::ostream& operator<<(std::ostream& os, TxId const& id) {
	std::uint8_t bytes[32];
	id.wire_digest().to_buffer(bytes);
	return os.write(reinterpret_cast<char const*>(bytes), sizeof(bytes));
}

std::istream& operator>>(std::istream& is, TxId& id) {
	std::uint8_t bytes[32];
	if (is.read(reinterpret_cast<char*>(bytes), sizeof(bytes))) {
		auto h = Sha256::Hash();
		h.from_buffer(bytes);
		id = TxId(std::move(h));
	}
	return is;
}

}
